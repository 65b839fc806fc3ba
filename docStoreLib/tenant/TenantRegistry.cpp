#include <docstore/migration/BuiltinMigrations.hpp>
#include <docstore/migration/MigrationManager.hpp>
#include <docstore/tenant/TenantRegistry.hpp>
#include <docstore/util/StoreError.hpp>
#include <docstore/util/textUtil.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace DocStore {

namespace fs = std::filesystem;

TenantRegistry::TenantRegistry(StoreConfig config, std::shared_ptr<const SchemaRegistry> schemas)
    : config_(std::move(config)), schemas_(std::move(schemas)) {}

bool TenantRegistry::isValidTenantId(const std::string& tenant) {
    // 경로 구성 요소로 쓰이므로 허용 문자 외에는 모두 거부한다 ("..", "/", 공백 포함).
    return util::isSafeIdentifier(tenant) && tenant.front() != '-';
}

std::string TenantRegistry::label(const TenantKey& tenant) { return tenant ? *tenant : std::string("<default>"); }

std::string TenantRegistry::usersDirectory() const { return (fs::path(config_.dataDir) / "users").string(); }

std::string TenantRegistry::directoryFor(const TenantKey& tenant) const {
    if (!tenant)
        return config_.dataDir;
    return (fs::path(usersDirectory()) / *tenant).string();
}

bool TenantRegistry::ensureDirectory(const std::string& dir, std::error_code& ec) const {
    const int attempts = std::max(1, config_.directoryRetries);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        ec.clear();
        fs::create_directories(dir, ec);
        // 다른 프로세스가 동시에 만든 경우 create_directories가 실패해도 디렉터리는 존재한다.
        std::error_code checkEc;
        if (fs::is_directory(dir, checkEc)) {
            ec.clear();
            return true;
        }
        if (attempt + 1 < attempts) {
            spdlog::warn("creating {} failed ({}), retrying", dir, ec ? ec.message() : "not a directory");
            std::this_thread::sleep_for(std::chrono::milliseconds(100 * (attempt + 1)));
        }
    }
    if (!ec)
        ec = std::make_error_code(std::errc::not_a_directory);
    spdlog::error("cannot create directory {} after {} attempts: {}", dir, attempts, ec.message());
    return false;
}

bool TenantRegistry::removeTree(const std::string& dir, std::error_code& ec) const {
    const int attempts = std::max(1, config_.directoryRetries);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        ec.clear();
        fs::remove_all(dir, ec);
        if (!ec)
            return true;
        if (attempt + 1 < attempts) {
            spdlog::warn("removing {} failed ({}), retrying", dir, ec.message());
            std::this_thread::sleep_for(std::chrono::milliseconds(100 * (attempt + 1)));
        }
    }
    spdlog::error("cannot remove {}: {}", dir, ec.message());
    return false;
}

std::optional<std::string> TenantRegistry::directoryOf(const TenantKey& tenant, std::error_code& ec) {
    ec.clear();
    // 빈 문자열도 거부한다. 기본 테넌트는 std::nullopt 로만 지정된다.
    if (tenant && !isValidTenantId(*tenant)) {
        spdlog::warn("rejected tenant id '{}'", *tenant);
        ec = StoreErrc::InvalidTenant;
        return std::nullopt;
    }
    std::string dir = directoryFor(tenant);
    if (!ensureDirectory(dir, ec))
        return std::nullopt;
    return dir;
}

std::shared_ptr<JsonFileRepository> TenantRegistry::makeRepository(const TenantKey& tenant,
                                                                   const std::string& entity,
                                                                   const std::string& dir) {
    if (schemas_ && schemas_->isLookup(entity)) {
        UsageProvider usage = [this, tenant](const std::string& source, std::vector<Json::Value>& records,
                                             std::error_code& ec) {
            auto repo = repositoryFor(tenant, source, ec);
            if (!repo)
                return false;
            records = repo->findAll(ec);
            return !ec;
        };
        return std::make_shared<LookupRepository>(entity, dir, schemas_, config_,
                                                  builtinSmartDefaultPolicy(entity), std::move(usage));
    }
    return std::make_shared<JsonFileRepository>(entity, dir, schemas_, config_);
}

std::shared_ptr<JsonFileRepository> TenantRegistry::repositoryFor(const TenantKey& tenant,
                                                                  const std::string& entity,
                                                                  std::error_code& ec) {
    ec.clear();
    if (!util::isSafeIdentifier(entity)) {
        spdlog::warn("rejected entity name '{}'", entity);
        ec = std::make_error_code(std::errc::invalid_argument);
        return nullptr;
    }

    const Key key(tenant, entity);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = repos_.find(key);
        if (it != repos_.end())
            return it->second;
    }

    auto dir = directoryOf(tenant, ec);
    if (!dir)
        return nullptr;

    std::lock_guard<std::mutex> lk(mutex_);
    auto it = repos_.find(key);
    if (it != repos_.end())
        return it->second;
    auto repo = makeRepository(tenant, entity, *dir);
    repos_.emplace(key, repo);
    spdlog::debug("repository created for tenant '{}' entity {}", label(tenant), entity);
    return repo;
}

std::shared_ptr<LookupRepository> TenantRegistry::lookupFor(const TenantKey& tenant, const std::string& entity,
                                                            std::error_code& ec) {
    auto repo = repositoryFor(tenant, entity, ec);
    if (!repo)
        return nullptr;
    auto lookup = std::dynamic_pointer_cast<LookupRepository>(repo);
    if (!lookup)
        ec = StoreErrc::NotALookup;
    return lookup;
}

bool TenantRegistry::initializeFromTemplate(const std::string& tenant, std::error_code& ec) {
    auto dir = tenantDirectory(tenant, ec);
    if (!dir)
        return false;

    if (!fs::is_directory(config_.templateDir, ec)) {
        spdlog::warn("template directory {} not found, tenant '{}' starts empty", config_.templateDir, tenant);
        ec.clear();
        return true;
    }

    size_t copied = 0;
    for (fs::directory_iterator it(config_.templateDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file() || it->path().extension() != ".json")
            continue;
        fs::copy_file(it->path(), fs::path(*dir) / it->path().filename(), fs::copy_options::overwrite_existing,
                      ec);
        if (ec) {
            spdlog::error("cannot copy {} to tenant '{}': {}", it->path().string(), tenant, ec.message());
            return false;
        }
        ++copied;
    }
    if (ec)
        return false;

    invalidateTenant(tenant);
    spdlog::info("tenant '{}' initialized from {} ({} file(s))", tenant, config_.templateDir, copied);
    return true;
}

void TenantRegistry::evictLocked(const TenantKey& tenant) {
    for (auto it = repos_.begin(); it != repos_.end();) {
        if (it->first.first == tenant)
            it = repos_.erase(it);
        else
            ++it;
    }
}

bool TenantRegistry::deleteTenant(const std::string& tenant, std::error_code& ec) {
    ec.clear();
    if (!isValidTenantId(tenant)) {
        spdlog::warn("refusing to delete tenant '{}'", tenant);
        ec = StoreErrc::InvalidTenant;
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        evictLocked(TenantKey(tenant));
    }
    if (!removeTree(directoryFor(TenantKey(tenant)), ec))
        return false;
    spdlog::info("tenant '{}' deleted", tenant);
    return true;
}

std::vector<std::string> TenantRegistry::listTenants(std::error_code& ec) const {
    ec.clear();
    std::vector<std::string> tenants;
    const std::string users = usersDirectory();
    // 아직 테넌트가 하나도 만들어지지 않은 저장소에는 users/ 가 없다.
    const fs::file_status st = fs::status(users, ec);
    if (ec && st.type() != fs::file_type::not_found)
        return tenants;
    ec.clear();
    if (!fs::is_directory(st))
        return tenants;
    for (fs::directory_iterator it(users, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (it->is_directory() && isValidTenantId(name))
            tenants.push_back(name);
    }
    std::sort(tenants.begin(), tenants.end());
    return tenants;
}

size_t TenantRegistry::cleanupEphemeralTenants(std::error_code& ec) {
    ec.clear();
    if (config_.ephemeralPrefix.empty()) {
        // 빈 접두사는 모든 테넌트와 일치하므로 아무것도 지우지 않는다.
        spdlog::error("refusing to clean up tenants: ephemeral prefix is empty");
        ec = std::make_error_code(std::errc::invalid_argument);
        return 0;
    }
    auto tenants = listTenants(ec);
    if (ec)
        return 0;

    size_t removed = 0;
    for (const auto& tenant : tenants) {
        if (!util::startsWith(tenant, config_.ephemeralPrefix))
            continue;
        if (!deleteTenant(tenant, ec))
            return removed;
        ++removed;
    }
    if (removed > 0)
        spdlog::info("removed {} ephemeral tenant(s)", removed);
    return removed;
}

void TenantRegistry::invalidateAllCaches(const std::optional<std::string>& tenant) {
    if (tenant) {
        invalidateTenant(tenant);
        return;
    }
    std::vector<std::shared_ptr<JsonFileRepository>> targets;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& kv : repos_)
            targets.push_back(kv.second);
    }
    for (auto& repo : targets)
        repo->invalidate();
    spdlog::debug("invalidated {} repository cache(s)", targets.size());
}

void TenantRegistry::invalidateDefaultCaches() { invalidateTenant(std::nullopt); }

void TenantRegistry::invalidateTenant(const TenantKey& tenant) {
    std::vector<std::shared_ptr<JsonFileRepository>> targets;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& kv : repos_) {
            if (kv.first.first == tenant)
                targets.push_back(kv.second);
        }
    }
    for (auto& repo : targets)
        repo->invalidate();
    spdlog::debug("invalidated {} repository cache(s) of tenant '{}'", targets.size(), label(tenant));
}

bool TenantRegistry::migrate(const TenantKey& tenant, std::error_code& ec) {
    auto dir = directoryOf(tenant, ec);
    if (!dir)
        return false;

    MigrationManager manager(*dir, config_);
    registerBuiltinMigrations(manager);
    bool ok = manager.runMigrations(ec);
    // 성공/실패와 관계없이 디스크가 바뀌었을 수 있으므로 캐시를 비운다.
    invalidateTenant(tenant);
    return ok;
}

} // namespace DocStore
