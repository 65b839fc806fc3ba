/**
 * @file docStoreLib/migration/MigrationManager.cpp
 * @brief 데이터 버전 관리와 마이그레이션 실행.
 * @details
 * - data_version.json 은 모든 단계가 성공한 뒤에만 갱신합니다. 실패 시 이전 값이 유지되므로
 *   재시도하면 같은 상태에서 다시 시작합니다.
 * - 각 마이그레이션 함수는 이미 적용된 데이터에서 변경 없이 성공해야 합니다.
 *   관리자는 이를 검증하지 않습니다.
 */
#include <docstore/migration/MigrationManager.hpp>
#include <docstore/migration/Version.hpp>
#include <docstore/repository/CollectionFile.hpp>
#include <docstore/util/JsonIo.hpp>
#include <docstore/util/StoreError.hpp>
#include <docstore/util/TimeUtil.hpp>
#include <docstore/util/textUtil.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>

namespace DocStore {

namespace fs = std::filesystem;

// =============================================================================
// MigrationContext
// =============================================================================

std::string MigrationContext::collectionPath(const std::string& entity) const {
    return (fs::path(dataDir_) / (entity + ".json")).string();
}

bool MigrationContext::exists(const std::string& entity) const {
    std::error_code ec;
    return fs::exists(collectionPath(entity), ec);
}

bool MigrationContext::load(const std::string& entity, Json::Value& records, std::error_code& ec) const {
    CollectionFile file(collectionPath(entity), lockDir_);
    return file.loadLocked(records, lockTimeout_, ec);
}

bool MigrationContext::store(const std::string& entity, const Json::Value& records, std::error_code& ec) const {
    CollectionFile file(collectionPath(entity), lockDir_);
    return file.storeLocked(records, lockTimeout_, ec);
}

// =============================================================================
// MigrationManager
// =============================================================================

MigrationManager::MigrationManager(std::string dataDir, const StoreConfig& config)
    : dataDir_(std::move(dataDir)), schemaFile_(config.effectiveSchemaVersionFile()),
      context_(dataDir_, config.effectiveLockDir(), config.writeLockTimeout) {}

void MigrationManager::registerMigration(Migration migration) {
    std::string key = migration.key();
    migrations_[key] = std::move(migration);
}

std::vector<std::string> MigrationManager::migrationKeys() const {
    std::vector<std::string> keys;
    for (const auto& kv : migrations_)
        keys.push_back(kv.first);
    return keys;
}

std::string MigrationManager::dataVersionFile() const {
    return (fs::path(dataDir_) / "data_version.json").string();
}

bool MigrationManager::getSchemaVersion(std::string& out, std::error_code& ec) const {
    ec.clear();
    out = "0.0";
    if (!fs::exists(schemaFile_, ec)) {
        // 스키마 선언 파일이 없으면 버전 관리 이전 상태로 본다.
        return !ec;
    }
    Json::Value root;
    if (!util::readJsonFile(schemaFile_, root, ec))
        return false;
    std::string declared;
    if (root.isObject()) {
        if (root["schema_version"].isString())
            declared = root["schema_version"].asString();
        else if (root["version"].isString())
            declared = root["version"].asString();
    }
    if (isVersionString(declared))
        out = declared;
    else if (!declared.empty())
        spdlog::warn("ignoring malformed schema version '{}' in {}", declared, schemaFile_);
    return true;
}

bool MigrationManager::getDataVersion(std::string& out, std::error_code& ec) const {
    ec.clear();
    out = "1.0";
    const std::string path = dataVersionFile();
    if (!fs::exists(path, ec))
        return !ec;
    Json::Value root;
    if (!util::readJsonFile(path, root, ec))
        return false;
    if (root.isObject() && root["version"].isString()) {
        const std::string stored = root["version"].asString();
        if (isVersionString(stored))
            out = stored;
        else
            spdlog::warn("ignoring malformed data version '{}' in {}", stored, path);
    }
    return true;
}

bool MigrationManager::setDataVersion(const std::string& version, const std::string& description,
                                      std::error_code& ec) {
    ec.clear();
    fs::create_directories(dataDir_, ec);
    if (ec)
        return false;
    Json::Value marker(Json::objectValue);
    marker["version"] = version;
    marker["migrated_at"] = util::nowTimestamp();
    marker["description"] = description;
    return util::writeJsonFileAtomic(dataVersionFile(), marker, ec);
}

bool MigrationManager::needsMigration(std::error_code& ec) const {
    std::string dataVersion;
    std::string schemaVersion;
    if (!getDataVersion(dataVersion, ec) || !getSchemaVersion(schemaVersion, ec))
        return false;
    return compareVersions(dataVersion, schemaVersion) < 0;
}

std::vector<std::string> MigrationManager::getMigrationPath(const std::string& from, const std::string& to) const {
    const std::string key = from + "->" + to;
    if (migrations_.count(key) != 0)
        return {key};
    // 다단계 경로 탐색은 하지 않는다. 직접 연결된 edge만 인정한다.
    spdlog::warn("no migration path found from {} to {}", from, to);
    return {};
}

std::optional<std::string> MigrationManager::backupData(std::error_code& ec) const {
    ec.clear();
    const fs::path base(dataDir_);
    const std::string stamp = util::compactStamp(util::Clock::now());

    fs::path backupDir = base / ("backup_" + stamp);
    for (int n = 1; fs::exists(backupDir, ec) && !ec; ++n)
        backupDir = base / ("backup_" + stamp + "_" + std::to_string(n));
    if (ec)
        return std::nullopt;

    fs::create_directories(backupDir, ec);
    if (ec) {
        spdlog::error("backup: cannot create {}: {}", backupDir.string(), ec.message());
        return std::nullopt;
    }

    size_t copied = 0;
    fs::directory_iterator it(base, ec);
    if (ec)
        return std::nullopt;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            return std::nullopt;
        const std::string name = it->path().filename().string();
        if (util::startsWith(name, "backup_")) {
            spdlog::debug("backup: skipping earlier backup {}", name);
            continue;
        }
        fs::copy(it->path(), backupDir / name,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) {
            spdlog::error("backup: cannot copy {}: {}", it->path().string(), ec.message());
            return std::nullopt;
        }
        ++copied;
    }
    if (ec)
        return std::nullopt;

    spdlog::info("backup: {} item(s) copied to {}", copied, backupDir.string());
    return backupDir.string();
}

bool MigrationManager::runMigrations(std::error_code& ec) {
    ec.clear();
    std::string dataVersion;
    std::string schemaVersion;
    if (!getDataVersion(dataVersion, ec) || !getSchemaVersion(schemaVersion, ec)) {
        spdlog::error("migration: cannot read version markers: {}", ec.message());
        return false;
    }
    if (compareVersions(dataVersion, schemaVersion) >= 0) {
        spdlog::info("data in {} is up to date (version {})", dataDir_, dataVersion);
        return true;
    }

    spdlog::info("migrating {} from {} to {}", dataDir_, dataVersion, schemaVersion);
    const std::vector<std::string> path = getMigrationPath(dataVersion, schemaVersion);
    if (path.empty()) {
        std::string available;
        for (const auto& k : migrationKeys())
            available += (available.empty() ? "" : ", ") + k;
        spdlog::error("no migration available from {} to {} (registered: {})", dataVersion, schemaVersion,
                      available);
        ec = StoreErrc::NoMigrationPath;
        return false;
    }

    bool needBackup = false;
    for (const auto& key : path)
        needBackup = needBackup || migrations_.at(key).requiresBackup;
    if (needBackup) {
        std::error_code bec;
        auto dir = backupData(bec);
        if (!dir) {
            spdlog::error("migration aborted, backup failed: {}", bec.message());
            ec = bec;
            return false;
        }
        spdlog::info("data backed up to {}", *dir);
    }

    for (size_t i = 0; i < path.size(); ++i) {
        const Migration& m = migrations_.at(path[i]);
        spdlog::info("running migration {}/{}: {} ({})", i + 1, path.size(), m.key(), m.description);
        std::error_code stepEc;
        bool ok = false;
        try {
            ok = m.run && m.run(context_, stepEc);
        } catch (const std::exception& e) {
            // jsoncpp, std::filesystem 예외는 여기서 MigrationFailed로 변환한다.
            spdlog::error("migration {} threw: {}", m.key(), e.what());
            ec = StoreErrc::MigrationFailed;
            return false;
        }
        if (!ok) {
            spdlog::error("migration {} failed: {}", m.key(), stepEc ? stepEc.message() : "no result");
            ec = StoreErrc::MigrationFailed;
            return false;
        }
        spdlog::info("migration {} completed", m.key());
    }

    if (!setDataVersion(schemaVersion, "Data migrated to version " + schemaVersion, ec)) {
        spdlog::error("migration: cannot write data version marker: {}", ec.message());
        return false;
    }
    spdlog::info("migration of {} completed, data version {}", dataDir_, schemaVersion);
    return true;
}

} // namespace DocStore
