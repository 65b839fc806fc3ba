/**
 * @file docStoreLib/repository/JsonFileRepository.cpp
 * @brief 컬렉션 파일 하나를 담당하는 JSON 저장소 구현.
 * @details
 * - 모든 읽기/쓰기는 컬렉션 lock 파일의 배타 잠금 안에서 수행됩니다.
 * - 캐시는 파일 stamp(mtime ns, size, inode)가 그대로일 때만 재사용합니다.
 * - 쓰기는 항상 전체 파일을 임시 파일에 기록한 뒤 rename으로 교체합니다.
 * - 잠금 순서는 file lock -> cacheMutex_ 입니다. 반대 순서로 잡지 마십시오.
 */
#include <docstore/repository/JsonFileRepository.hpp>
#include <docstore/util/StoreError.hpp>
#include <docstore/util/TimeUtil.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <limits>

namespace DocStore {

namespace fs = std::filesystem;

JsonFileRepository::JsonFileRepository(std::string entity, const std::string& dir,
                                       std::shared_ptr<const SchemaRegistry> schemas,
                                       const StoreConfig& config)
    : entity_(std::move(entity)),
      file_((fs::path(dir) / (entity_ + ".json")).string(), config.effectiveLockDir()),
      schemas_(std::move(schemas)), readTimeout_(config.readLockTimeout),
      writeTimeout_(config.writeLockTimeout) {}

RecordId JsonFileRepository::recordId(const Json::Value& record) {
    const Json::Value& id = record["id"];
    // UInt64 범위 값은 asInt64 에서 예외가 나므로 Int64 로 표현 가능한 것만 받는다.
    if (!id.isIntegral() || !id.isInt64())
        return -1;
    return static_cast<RecordId>(id.asInt64());
}

// =============================================================================
// Cache
// =============================================================================

bool JsonFileRepository::cachedIfFresh(const FileStamp& stamp, Json::Value& out) const {
    std::lock_guard<std::mutex> lk(cacheMutex_);
    if (!cacheValid_ || cacheStamp_ != stamp)
        return false;
    out = cache_;
    return true;
}

void JsonFileRepository::storeCache(const Json::Value& records, const FileStamp& stamp) {
    std::lock_guard<std::mutex> lk(cacheMutex_);
    cache_ = records;
    cacheStamp_ = stamp;
    cacheValid_ = true;
}

void JsonFileRepository::invalidate() {
    std::lock_guard<std::mutex> lk(cacheMutex_);
    cache_ = Json::Value(Json::arrayValue);
    cacheStamp_ = FileStamp{};
    cacheValid_ = false;
    spdlog::debug("{}: cache invalidated", entity_);
}

bool JsonFileRepository::snapshot(Json::Value& records, std::error_code& ec) {
    ec.clear();

    // 잠금 없이 stat만 해서 캐시가 최신이면 디스크를 읽지 않는다.
    FileStamp stamp;
    if (!file_.stat(stamp, ec))
        return false;
    if (cachedIfFresh(stamp, records)) {
        spdlog::debug("{}: cache hit", entity_);
        return true;
    }

    auto guard = file_.lock(readTimeout_, ec);
    if (ec)
        return false;

    // 잠금을 잡은 뒤 다시 stat 한다. 그 사이 다른 writer가 파일을 교체했을 수 있다.
    if (!file_.stat(stamp, ec))
        return false;
    if (cachedIfFresh(stamp, records))
        return true;

    spdlog::debug("{}: cache miss, reading {}", entity_, file_.path());
    if (!file_.read(records, ec))
        return false;
    storeCache(records, stamp);
    return true;
}

bool JsonFileRepository::mutate(const Mutation& fn, std::error_code& ec) {
    ec.clear();
    auto guard = file_.lock(writeTimeout_, ec);
    if (ec)
        return false;

    FileStamp stamp;
    if (!file_.stat(stamp, ec))
        return false;

    Json::Value records;
    if (!cachedIfFresh(stamp, records)) {
        if (!file_.read(records, ec))
            return false;
        storeCache(records, stamp);
    }

    if (!fn(records, ec) || ec)
        return !ec;

    if (!file_.write(records, ec)) {
        spdlog::error("{}: write of {} failed: {}", entity_, file_.path(), ec.message());
        return false;
    }

    // 방금 기록한 내용을 그대로 캐시에 반영한다. stamp만 새로 얻으면 된다.
    FileStamp written;
    std::error_code statEc;
    if (file_.stat(written, statEc)) {
        storeCache(records, written);
    } else {
        spdlog::warn("{}: stat after write failed: {}", entity_, statEc.message());
        invalidate();
    }
    return true;
}

void JsonFileRepository::onRecordWritten(Json::Value&, Json::ArrayIndex) {}

// =============================================================================
// Schema
// =============================================================================

void JsonFileRepository::stripUnknown(Json::Value& record) const {
    if (!schemas_)
        return;
    size_t removed = schemas_->stripUnknownFields(entity_, record);
    if (removed > 0)
        spdlog::debug("{}: stripped {} unknown field(s)", entity_, removed);
}

bool JsonFileRepository::checkSchema(const Json::Value& record, std::vector<FieldViolation>* violations,
                                     std::error_code& ec) const {
    if (!schemas_)
        return true;
    std::vector<FieldViolation> found;
    if (schemas_->validate(entity_, record, found))
        return true;

    spdlog::warn("{}: validation failed: {}", entity_, describeViolations(found));
    if (violations != nullptr)
        *violations = std::move(found);
    ec = StoreErrc::ValidationFailed;
    return false;
}

// =============================================================================
// CRUD Operations
// =============================================================================

std::optional<Json::Value> JsonFileRepository::create(const Json::Value& input,
                                                      std::vector<FieldViolation>* violations,
                                                      std::error_code& ec) {
    ec.clear();
    if (!input.isObject()) {
        if (violations != nullptr)
            *violations = {{"", "record must be a JSON object"}};
        ec = StoreErrc::ValidationFailed;
        return std::nullopt;
    }

    // 파생/조인 필드가 저장되지 않도록 검증 전에 항상 허용 목록 밖 필드를 제거한다.
    Json::Value record = input;
    stripUnknown(record);

    std::optional<Json::Value> stored;
    bool ok = mutate(
        [&](Json::Value& records, std::error_code& mec) {
            RecordId next = 1;
            for (const auto& r : records) {
                const RecordId id = recordId(r);
                if (id == std::numeric_limits<RecordId>::max()) {
                    spdlog::error("{}: id {} leaves no room for a new record", path(), id);
                    mec = StoreErrc::CorruptCollection;
                    return false;
                }
                next = std::max(next, id + 1);
            }

            record["id"] = Json::Int64(next);
            const std::string now = util::nowTimestamp();
            record["created_at"] = now;
            record["updated_at"] = now;
            if (!checkSchema(record, violations, mec))
                return false;

            records.append(record);
            onRecordWritten(records, records.size() - 1);
            stored = records[records.size() - 1];
            return true;
        },
        ec);

    if (!ok)
        return std::nullopt;
    spdlog::debug("{}: created id {}", entity_, recordId(*stored));
    return stored;
}

std::optional<Json::Value> JsonFileRepository::update(RecordId id, const Json::Value& input,
                                                      std::vector<FieldViolation>* violations,
                                                      std::error_code& ec) {
    ec.clear();
    if (!input.isObject()) {
        if (violations != nullptr)
            *violations = {{"", "record must be a JSON object"}};
        ec = StoreErrc::ValidationFailed;
        return std::nullopt;
    }

    Json::Value incoming = input;
    stripUnknown(incoming);

    std::optional<Json::Value> stored;
    bool ok = mutate(
        [&](Json::Value& records, std::error_code& mec) {
            for (Json::ArrayIndex i = 0; i < records.size(); ++i) {
                if (recordId(records[i]) != id)
                    continue;

                // 기존 레코드에 섞여 있을 수 있는 비정규 필드도 함께 제거한다.
                Json::Value merged = records[i];
                stripUnknown(merged);
                for (const auto& key : incoming.getMemberNames())
                    merged[key] = incoming[key];

                const std::string now = util::nowTimestamp();
                merged["id"] = Json::Int64(id);
                merged["created_at"] =
                    records[i].isMember("created_at") ? records[i]["created_at"] : Json::Value(now);
                merged["updated_at"] = now;
                if (!checkSchema(merged, violations, mec))
                    return false;

                records[i] = merged;
                onRecordWritten(records, i);
                stored = records[i];
                return true;
            }
            return false;
        },
        ec);

    if (!ok || !stored)
        return std::nullopt;
    return stored;
}

bool JsonFileRepository::deleteById(RecordId id, std::error_code& ec) {
    bool removed = false;
    bool ok = mutate(
        [&](Json::Value& records, std::error_code&) {
            Json::Value kept(Json::arrayValue);
            for (const auto& r : records) {
                if (recordId(r) == id) {
                    removed = true;
                    continue;
                }
                kept.append(r);
            }
            if (!removed)
                return false;
            records = std::move(kept);
            return true;
        },
        ec);
    return ok && removed;
}

size_t JsonFileRepository::removeWhere(const std::string& field, const Json::Value& value,
                                       std::error_code& ec) {
    size_t removed = 0;
    bool ok = mutate(
        [&](Json::Value& records, std::error_code&) {
            Json::Value kept(Json::arrayValue);
            for (const auto& r : records) {
                if (r.isMember(field) && r[field] == value) {
                    ++removed;
                    continue;
                }
                kept.append(r);
            }
            if (removed == 0)
                return false;
            records = std::move(kept);
            return true;
        },
        ec);
    if (!ok)
        return 0;
    if (removed > 0)
        spdlog::debug("{}: removed {} record(s) where {} matched", entity_, removed, field);
    return removed;
}

std::optional<Json::Value> JsonFileRepository::findById(RecordId id, std::error_code& ec) {
    Json::Value records;
    if (!snapshot(records, ec))
        return std::nullopt;
    for (const auto& r : records) {
        if (recordId(r) == id)
            return r;
    }
    return std::nullopt;
}

std::vector<Json::Value> JsonFileRepository::findAll(std::error_code& ec) {
    std::vector<Json::Value> result;
    Json::Value records;
    if (!snapshot(records, ec))
        return result;
    result.reserve(records.size());
    for (auto& r : records)
        result.push_back(std::move(r));
    return result;
}

std::vector<Json::Value> JsonFileRepository::findWhere(const std::string& field, const Json::Value& value,
                                                       std::error_code& ec) {
    std::vector<Json::Value> result;
    Json::Value records;
    if (!snapshot(records, ec))
        return result;
    for (const auto& r : records) {
        if (r.isMember(field) && r[field] == value)
            result.push_back(r);
    }
    return result;
}

size_t JsonFileRepository::count(std::error_code& ec) {
    Json::Value records;
    if (!snapshot(records, ec))
        return 0;
    return records.size();
}

bool JsonFileRepository::existsById(RecordId id, std::error_code& ec) {
    Json::Value records;
    if (!snapshot(records, ec))
        return false;
    for (const auto& r : records) {
        if (recordId(r) == id)
            return true;
    }
    return false;
}

} // namespace DocStore
