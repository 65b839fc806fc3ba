#include <docstore/config/StoreConfig.hpp>
#include <docstore/util/JsonIo.hpp>
#include <docstore/util/textUtil.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>

namespace DocStore {

namespace fs = std::filesystem;

std::string StoreConfig::effectiveLockDir() const {
    if (!lockDir.empty())
        return lockDir;
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec)
        tmp = "/tmp";
    return (tmp / "docstore_locks").string();
}

std::string StoreConfig::effectiveSchemaVersionFile() const {
    if (!schemaVersionFile.empty())
        return schemaVersionFile;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec)
        cwd = ".";
    return (cwd / "schema_version.json").string();
}

namespace {

bool readString(const Json::Value& root, const char* key, std::string& out, std::error_code& ec) {
    if (!root.isMember(key))
        return true;
    const Json::Value& v = root[key];
    if (!v.isString()) {
        spdlog::error("config: '{}' must be a string", key);
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    out = v.asString();
    return true;
}

bool readInt(const Json::Value& root, const char* key, long long& out, std::error_code& ec) {
    if (!root.isMember(key))
        return true;
    const Json::Value& v = root[key];
    if (!v.isIntegral() || v.asInt64() < 0) {
        spdlog::error("config: '{}' must be a non-negative integer", key);
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    out = v.asInt64();
    return true;
}

} // namespace

bool loadStoreConfig(const std::string& path, StoreConfig& config, std::error_code& ec) {
    ec.clear();
    Json::Value root;
    if (!util::readJsonFile(path, root, ec))
        return false;
    if (!root.isObject()) {
        spdlog::error("config: {} is not a JSON object", path);
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    // 값을 임시 사본에 적용한 뒤 전부 성공했을 때만 반영한다.
    StoreConfig next = config;
    long long readMs = next.readLockTimeout.count();
    long long writeMs = next.writeLockTimeout.count();
    long long retries = next.directoryRetries;

    if (!readString(root, "data_dir", next.dataDir, ec) ||
        !readString(root, "lock_dir", next.lockDir, ec) ||
        !readString(root, "schema_version_file", next.schemaVersionFile, ec) ||
        !readString(root, "template_dir", next.templateDir, ec) ||
        !readString(root, "ephemeral_prefix", next.ephemeralPrefix, ec) ||
        !readString(root, "log_level", next.logLevel, ec) ||
        !readInt(root, "read_lock_timeout_ms", readMs, ec) ||
        !readInt(root, "write_lock_timeout_ms", writeMs, ec) ||
        !readInt(root, "directory_retries", retries, ec))
        return false;

    if (retries < 1) {
        spdlog::error("config: 'directory_retries' must be at least 1");
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    // 빈 접두사는 cleanupEphemeralTenants 가 모든 테넌트를 지우게 만든다.
    if (next.ephemeralPrefix.empty()) {
        spdlog::error("config: 'ephemeral_prefix' must not be empty");
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    next.readLockTimeout = std::chrono::milliseconds(readMs);
    next.writeLockTimeout = std::chrono::milliseconds(writeMs);
    next.directoryRetries = static_cast<int>(retries);
    config = std::move(next);
    return true;
}

bool applyEnvironment(StoreConfig& config, std::error_code& ec) {
    ec.clear();
    auto env = [](const char* name) -> const char* {
        const char* v = std::getenv(name);
        return (v != nullptr && *v != '\0') ? v : nullptr;
    };

    long timeoutMs = 0;
    const char* timeout = env("DOCSTORE_LOCK_TIMEOUT_MS");
    if (timeout != nullptr) {
        if (!util::parseLongStrict(timeout, timeoutMs, ec))
            return false;
        if (timeoutMs < 0) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
    }

    if (const char* v = env("DOCSTORE_DATA_DIR"))
        config.dataDir = v;
    if (const char* v = env("DOCSTORE_LOCK_DIR"))
        config.lockDir = v;
    if (const char* v = env("DOCSTORE_LOG_LEVEL"))
        config.logLevel = v;
    if (timeout != nullptr) {
        config.readLockTimeout = std::chrono::milliseconds(timeoutMs);
        config.writeLockTimeout = std::chrono::milliseconds(timeoutMs);
    }
    return true;
}

void applyLogLevel(const StoreConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.logLevel));
}

} // namespace DocStore
