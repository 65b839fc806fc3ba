#pragma once
/// @file JsonFileRepository.hpp
/// @brief File-backed JSON collection repository with mtime-checked cache

#include "../config/StoreConfig.hpp"
#include "../schema/SchemaRegistry.hpp"
#include "CollectionFile.hpp"
#include "RecordRepository.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace DocStore {

/// @brief Generic repository over one entity-type collection file
/// @details Every read and write takes the collection's exclusive file lock.
///          Reads are served from an in-memory snapshot while the file's
///          stamp is unchanged. Writes replace the whole file atomically and
///          refresh the snapshot directly.
///
///          Lock order is always file lock, then cache mutex.
class JsonFileRepository : public RecordRepository {
  public:
    /// @param entity Entity type name (file `<dir>/<entity>.json`)
    /// @param dir Tenant data directory
    /// @param schemas Schema registry (nullptr treats the entity as unmodeled)
    /// @param config Lock directory and lock timeouts
    JsonFileRepository(std::string entity, const std::string& dir,
                       std::shared_ptr<const SchemaRegistry> schemas, const StoreConfig& config);
    ~JsonFileRepository() override = default;

    JsonFileRepository(const JsonFileRepository&) = delete;
    JsonFileRepository& operator=(const JsonFileRepository&) = delete;

    using RecordRepository::create;
    using RecordRepository::update;

    std::optional<Json::Value> create(const Json::Value& input, std::vector<FieldViolation>* violations,
                                      std::error_code& ec) override;
    std::optional<Json::Value> update(RecordId id, const Json::Value& input,
                                      std::vector<FieldViolation>* violations,
                                      std::error_code& ec) override;
    bool deleteById(RecordId id, std::error_code& ec) override;
    std::optional<Json::Value> findById(RecordId id, std::error_code& ec) override;
    std::vector<Json::Value> findAll(std::error_code& ec) override;
    size_t count(std::error_code& ec) override;
    bool existsById(RecordId id, std::error_code& ec) override;
    void invalidate() override;

    /// @brief Records whose `field` equals `value`
    std::vector<Json::Value> findWhere(const std::string& field, const Json::Value& value,
                                       std::error_code& ec);

    /// @brief Delete every record whose `field` equals `value` in one write
    /// @return Number of removed records
    size_t removeWhere(const std::string& field, const Json::Value& value, std::error_code& ec);

    const std::string& entity() const noexcept { return entity_; }
    const std::string& path() const noexcept { return file_.path(); }

    /// @brief `id` member of a record, or -1 when missing or not integral
    static RecordId recordId(const Json::Value& record);

  protected:
    /// @brief Read-modify-write step run under the exclusive lock
    /// @details Returns true when `records` was changed and must be written.
    ///          Setting `ec` aborts without writing.
    using Mutation = std::function<bool(Json::Value& records, std::error_code& ec)>;

    /// @brief Run `fn` on the current collection under the file lock and persist its result
    bool mutate(const Mutation& fn, std::error_code& ec);

    /// @brief Current collection content, served from cache when the file is unchanged
    bool snapshot(Json::Value& records, std::error_code& ec);

    /// @brief Hook called inside the write cycle after records[index] was created or updated
    virtual void onRecordWritten(Json::Value& records, Json::ArrayIndex index);

    /// @brief Validate against the entity schema, filling violations and logging on failure
    bool checkSchema(const Json::Value& record, std::vector<FieldViolation>* violations,
                     std::error_code& ec) const;

    const std::shared_ptr<const SchemaRegistry>& schemas() const noexcept { return schemas_; }

  private:
    /// @brief Cached content if the cache matches `stamp`
    bool cachedIfFresh(const FileStamp& stamp, Json::Value& out) const;
    void storeCache(const Json::Value& records, const FileStamp& stamp);
    void stripUnknown(Json::Value& record) const;

    std::string entity_;
    CollectionFile file_;
    std::shared_ptr<const SchemaRegistry> schemas_;
    std::chrono::milliseconds readTimeout_;
    std::chrono::milliseconds writeTimeout_;

    // Cache members (guarded by cacheMutex_)
    mutable std::mutex cacheMutex_;
    Json::Value cache_{Json::arrayValue};
    bool cacheValid_ = false;
    FileStamp cacheStamp_;
};

} // namespace DocStore
