#pragma once
/// @file TenantRegistry.hpp
/// @brief Per-(tenant, entity) repository cache and tenant directory lifecycle

#include "../config/StoreConfig.hpp"
#include "../repository/LookupRepository.hpp"
#include "../schema/SchemaRegistry.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace DocStore {

/// @brief Store context: owns every repository instance of the process
///
/// Construct one at process start and pass it to consumers. The default
/// tenant is stored directly in StoreConfig::dataDir and is reached only
/// through the *Default* members; named tenants live in
/// `<dataDir>/users/<tenant>` and an empty name is rejected like any other
/// invalid id.
///
/// @note Lookup repositories created here load smart-default usage through
///       this registry, so it must outlive every repository it hands out.
class TenantRegistry {
  public:
    TenantRegistry(StoreConfig config, std::shared_ptr<const SchemaRegistry> schemas);

    TenantRegistry(const TenantRegistry&) = delete;
    TenantRegistry& operator=(const TenantRegistry&) = delete;

    /// @brief Letters, digits, '-' and '_' only, not starting with '-'
    static bool isValidTenantId(const std::string& tenant);

    /// @brief Data directory of a tenant, created on first use
    /// @param ec StoreErrc::InvalidTenant for a rejected id, errno if creation keeps failing
    std::optional<std::string> tenantDirectory(const std::string& tenant, std::error_code& ec) {
        return directoryOf(TenantKey(tenant), ec);
    }

    /// @brief Data directory of the default tenant (StoreConfig::dataDir)
    std::optional<std::string> defaultDirectory(std::error_code& ec) { return directoryOf(std::nullopt, ec); }

    /// @brief Cached repository for (tenant, entity), constructed lazily
    /// @details Lookup entities get a LookupRepository.
    std::shared_ptr<JsonFileRepository> getRepository(const std::string& tenant, const std::string& entity,
                                                      std::error_code& ec) {
        return repositoryFor(TenantKey(tenant), entity, ec);
    }

    /// @brief Cached lookup repository
    /// @param ec StoreErrc::NotALookup when the entity is not a lookup collection
    std::shared_ptr<LookupRepository> getLookupRepository(const std::string& tenant, const std::string& entity,
                                                          std::error_code& ec) {
        return lookupFor(TenantKey(tenant), entity, ec);
    }

    /// @brief getRepository for the default tenant
    std::shared_ptr<JsonFileRepository> getDefaultRepository(const std::string& entity, std::error_code& ec) {
        return repositoryFor(std::nullopt, entity, ec);
    }

    /// @brief getLookupRepository for the default tenant
    std::shared_ptr<LookupRepository> getDefaultLookupRepository(const std::string& entity, std::error_code& ec) {
        return lookupFor(std::nullopt, entity, ec);
    }

    /// @brief Copy every *.json file of StoreConfig::templateDir into the tenant directory
    bool initializeFromTemplate(const std::string& tenant, std::error_code& ec);

    /// @brief Remove a named tenant's directory tree and evict its repositories
    bool deleteTenant(const std::string& tenant, std::error_code& ec);

    /// @brief Delete every tenant whose id starts with StoreConfig::ephemeralPrefix
    /// @param ec std::errc::invalid_argument when the prefix is empty (nothing is removed)
    /// @return Number of removed tenants
    size_t cleanupEphemeralTenants(std::error_code& ec);

    /// @brief Named tenants present on disk, sorted
    std::vector<std::string> listTenants(std::error_code& ec) const;

    /// @brief Drop cached collection content of one named tenant's repositories, or of all
    void invalidateAllCaches(const std::optional<std::string>& tenant = std::nullopt);

    /// @brief Drop cached collection content of the default tenant's repositories
    void invalidateDefaultCaches();

    /// @brief Run the built-in migrations on one tenant, then invalidate its caches
    bool migrateTenant(const std::string& tenant, std::error_code& ec) { return migrate(TenantKey(tenant), ec); }

    /// @brief migrateTenant for the default tenant
    bool migrateDefault(std::error_code& ec) { return migrate(std::nullopt, ec); }

    const StoreConfig& config() const noexcept { return config_; }
    const std::shared_ptr<const SchemaRegistry>& schemas() const noexcept { return schemas_; }

  private:
    using TenantKey = std::optional<std::string>; ///< std::nullopt is the default tenant
    using Key = std::pair<TenantKey, std::string>; ///< (tenant, entity)

    static std::string label(const TenantKey& tenant);

    std::string directoryFor(const TenantKey& tenant) const;
    std::string usersDirectory() const;
    bool ensureDirectory(const std::string& dir, std::error_code& ec) const;
    bool removeTree(const std::string& dir, std::error_code& ec) const;

    std::optional<std::string> directoryOf(const TenantKey& tenant, std::error_code& ec);
    std::shared_ptr<JsonFileRepository> repositoryFor(const TenantKey& tenant, const std::string& entity,
                                                      std::error_code& ec);
    std::shared_ptr<LookupRepository> lookupFor(const TenantKey& tenant, const std::string& entity,
                                                std::error_code& ec);
    std::shared_ptr<JsonFileRepository> makeRepository(const TenantKey& tenant, const std::string& entity,
                                                       const std::string& dir);
    bool migrate(const TenantKey& tenant, std::error_code& ec);
    void invalidateTenant(const TenantKey& tenant);
    /// @note Caller holds mutex_
    void evictLocked(const TenantKey& tenant);

    StoreConfig config_;
    std::shared_ptr<const SchemaRegistry> schemas_;

    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<JsonFileRepository>> repos_;
};

} // namespace DocStore
