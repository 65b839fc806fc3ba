#pragma once
/// @file MigrationManager.hpp
/// @brief Data version tracking, backup and ordered execution of migrations

#include "../config/StoreConfig.hpp"

#include <json/json.h>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace DocStore {

/// @brief File access handed to migration functions
/// @details Collections are read and replaced under the same lock files the
///          repositories use, so a migration never races a running repository.
class MigrationContext {
  public:
    MigrationContext(std::string dataDir, std::string lockDir, std::chrono::milliseconds lockTimeout)
        : dataDir_(std::move(dataDir)), lockDir_(std::move(lockDir)), lockTimeout_(lockTimeout) {}

    const std::string& dataDir() const noexcept { return dataDir_; }

    /// @brief `<dataDir>/<entity>.json`
    std::string collectionPath(const std::string& entity) const;

    /// @brief True when the collection file exists
    bool exists(const std::string& entity) const;

    /// @brief Locked read (missing file -> empty array)
    bool load(const std::string& entity, Json::Value& records, std::error_code& ec) const;

    /// @brief Locked atomic replace
    bool store(const std::string& entity, const Json::Value& records, std::error_code& ec) const;

  private:
    std::string dataDir_;
    std::string lockDir_;
    std::chrono::milliseconds lockTimeout_;
};

/// @brief Migration body
/// @details Must detect "already applied" and succeed without changes, and
///          must tolerate missing or empty source collections. May throw;
///          the manager converts exceptions to StoreErrc::MigrationFailed.
using MigrationFn = std::function<bool(const MigrationContext& ctx, std::error_code& ec)>;

/// @brief One registered version edge
struct Migration {
    std::string from;
    std::string to;
    std::string description;
    bool requiresBackup = true; ///< false only for purely additive migrations
    MigrationFn run;

    /// @brief `"<from>-><to>"`
    std::string key() const { return from + "->" + to; }
};

/// @brief Brings one data directory up to the program's schema version
/// @details Only direct edges are resolved: a data version two or more
///          registered steps behind the target has no migration path.
class MigrationManager {
  public:
    /// @param dataDir Tenant data directory holding data_version.json
    /// @param config Schema version file, lock directory and write timeout
    MigrationManager(std::string dataDir, const StoreConfig& config);

    /// @brief Add or replace the migration for migration.key()
    void registerMigration(Migration migration);

    /// @brief Registered keys in ascending order
    std::vector<std::string> migrationKeys() const;

    /// @brief Target version from the schema version file
    /// @details Key `schema_version`, falling back to `version`. "0.0" when the file is absent.
    bool getSchemaVersion(std::string& out, std::error_code& ec) const;

    /// @brief Current version from `<dataDir>/data_version.json`, "1.0" when absent
    bool getDataVersion(std::string& out, std::error_code& ec) const;

    /// @brief Atomically write the data version marker
    bool setDataVersion(const std::string& version, const std::string& description, std::error_code& ec);

    /// @brief True iff data version < schema version
    bool needsMigration(std::error_code& ec) const;

    /// @brief The single registered edge from -> to, or empty (logged) when none exists
    std::vector<std::string> getMigrationPath(const std::string& from, const std::string& to) const;

    /// @brief Run the migrations required to reach the schema version
    /// @details No-op success when up to date. Takes a backup first unless
    ///          every step is declared safe. On failure the data version
    ///          marker is left unchanged.
    /// @param ec StoreErrc::NoMigrationPath, StoreErrc::MigrationFailed or an errno value
    bool runMigrations(std::error_code& ec);

    /// @brief Copy the data directory (except earlier backups) to `backup_<timestamp>`
    /// @return Backup directory path
    std::optional<std::string> backupData(std::error_code& ec) const;

    const std::string& dataDir() const noexcept { return dataDir_; }
    const std::string& schemaVersionFile() const noexcept { return schemaFile_; }

  private:
    std::string dataVersionFile() const;

    std::string dataDir_;
    std::string schemaFile_;
    MigrationContext context_;
    std::map<std::string, Migration> migrations_;
};

} // namespace DocStore
