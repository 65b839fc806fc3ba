#pragma once
/// @file StoreConfig.hpp
/// @brief Runtime configuration of the document store

#include <chrono>
#include <string>
#include <system_error>

namespace DocStore {

/// @brief Store-wide settings, constructed once at process start and injected
struct StoreConfig {
    /// Base data directory. The unnamed default tenant lives here,
    /// named tenants live in `<dataDir>/users/<tenant>`.
    std::string dataDir = "data";
    /// Directory for collection lock files. Empty means `<system tmp>/docstore_locks`.
    std::string lockDir;
    /// Program-side file declaring the target schema version.
    /// Empty means `<current dir>/schema_version.json`.
    std::string schemaVersionFile;
    /// Baseline dataset copied by TenantRegistry::initializeFromTemplate.
    std::string templateDir = "test_data";
    /// Tenants whose id starts with this prefix are ephemeral.
    std::string ephemeralPrefix = "test_";

    std::chrono::milliseconds readLockTimeout{5000};
    std::chrono::milliseconds writeLockTimeout{10000};

    /// Attempts for racy directory creation/removal before giving up.
    int directoryRetries = 3;

    /// spdlog level name: trace, debug, info, warn, error, critical, off
    std::string logLevel = "info";

    /// @brief lockDir with the default applied
    std::string effectiveLockDir() const;

    /// @brief schemaVersionFile with the default applied
    std::string effectiveSchemaVersionFile() const;
};

/// @brief Load overrides from a JSON object file into `config`
/// @details Keys: data_dir, lock_dir, schema_version_file, template_dir,
///          ephemeral_prefix, read_lock_timeout_ms, write_lock_timeout_ms,
///          directory_retries, log_level. Unknown keys are ignored.
/// @param ec errno on I/O failure, invalid_argument for wrong-typed values
bool loadStoreConfig(const std::string& path, StoreConfig& config, std::error_code& ec);

/// @brief Apply environment overrides to `config`
/// @details DOCSTORE_DATA_DIR, DOCSTORE_LOCK_DIR, DOCSTORE_LOG_LEVEL and
///          DOCSTORE_LOCK_TIMEOUT_MS (applied to both read and write timeouts).
///          Unset variables leave the field unchanged.
/// @param ec invalid_argument or result_out_of_range for a malformed timeout
bool applyEnvironment(StoreConfig& config, std::error_code& ec);

/// @brief Apply config.logLevel to the default spdlog logger
void applyLogLevel(const StoreConfig& config);

} // namespace DocStore
