#include <docstore/repository/LookupRepository.hpp>
#include <docstore/util/StoreError.hpp>
#include <docstore/util/textUtil.hpp>

#include <spdlog/spdlog.h>

namespace DocStore {

namespace {

bool isDefault(const Json::Value& record) {
    const Json::Value& flag = record["is_default"];
    return flag.isBool() && flag.asBool();
}

std::string textField(const Json::Value& record, const char* field) {
    const Json::Value& v = record[field];
    return v.isString() ? v.asString() : std::string();
}

// 1 과 1.0, Int 와 UInt 표현 차이는 같은 값으로 본다.
bool sameValue(const Json::Value& a, const Json::Value& b) {
    if (a.isNumeric() && b.isNumeric()) {
        if (a.isIntegral() && b.isIntegral())
            return a.asLargestInt() == b.asLargestInt();
        return a.asDouble() == b.asDouble();
    }
    return a == b;
}

bool matchesScope(const Json::Value& record, const Json::Value& scope) {
    for (const auto& field : scope.getMemberNames()) {
        if (!record.isMember(field) || !sameValue(record[field], scope[field]))
            return false;
    }
    return true;
}

} // namespace

LookupRepository::LookupRepository(std::string entity, const std::string& dir,
                                   std::shared_ptr<const SchemaRegistry> schemas, const StoreConfig& config,
                                   std::optional<SmartDefaultPolicy> policy, UsageProvider usage)
    : JsonFileRepository(std::move(entity), dir, std::move(schemas), config), policy_(std::move(policy)),
      usage_(std::move(usage)) {}

void LookupRepository::onRecordWritten(Json::Value& records, Json::ArrayIndex index) {
    if (!isDefault(records[index]))
        return;
    // 같은 쓰기 사이클 안에서 나머지 기본값 플래그를 내린다.
    for (Json::ArrayIndex i = 0; i < records.size(); ++i) {
        if (i != index && isDefault(records[i]))
            records[i]["is_default"] = false;
    }
}

Json::Value LookupRepository::identityScope(const Json::Value& extra) const {
    Json::Value scope(Json::objectValue);
    const EntitySchema* schema = schemas() ? schemas()->getSchema(entity()) : nullptr;
    if (schema == nullptr || !extra.isObject())
        return scope;
    // name 외의 필수 필드(regions 의 country_id)는 이름과 함께 레코드를 식별한다.
    for (const auto& field : schema->required) {
        if (field != "name" && extra.isMember(field))
            scope[field] = extra[field];
    }
    return scope;
}

std::optional<Json::Value> LookupRepository::findByKey(const char* field, const std::string& value,
                                                       std::error_code& ec) {
    return findByKey(field, value, Json::Value(Json::objectValue), ec);
}

std::optional<Json::Value> LookupRepository::findByKey(const char* field, const std::string& value,
                                                       const Json::Value& scope, std::error_code& ec) {
    ec.clear();
    const std::string key = util::normalizeKey(value);
    if (key.empty())
        return std::nullopt;

    Json::Value records;
    if (!snapshot(records, ec))
        return std::nullopt;
    for (const auto& r : records) {
        const std::string candidate = textField(r, field);
        if (!candidate.empty() && util::normalizeKey(candidate) == key && matchesScope(r, scope))
            return r;
    }
    return std::nullopt;
}

std::optional<Json::Value> LookupRepository::findByName(const std::string& name, std::error_code& ec) {
    return findByKey("name", name, ec);
}

std::optional<Json::Value> LookupRepository::findByShortForm(const std::string& shortForm, std::error_code& ec) {
    return findByKey("short_form", shortForm, ec);
}

std::optional<Json::Value> LookupRepository::findByNameOrShortForm(const std::string& identifier,
                                                                   std::error_code& ec) {
    auto found = findByName(identifier, ec);
    if (found || ec)
        return found;
    return findByShortForm(identifier, ec);
}

std::optional<Json::Value> LookupRepository::getOrCreate(const std::string& name, const Json::Value& extra,
                                                         std::error_code& ec) {
    auto existing = findByKey("name", name, identityScope(extra), ec);
    if (existing || ec)
        return existing;

    Json::Value input = extra.isObject() ? extra : Json::Value(Json::objectValue);
    input["name"] = name;
    return create(input, ec);
}

std::optional<Json::Value> LookupRepository::getOrCreateByIdentifier(const std::string& identifier,
                                                                     const Json::Value& extra,
                                                                     std::error_code& ec) {
    const Json::Value scope = identityScope(extra);
    auto existing = findByKey("name", identifier, scope, ec);
    if (existing || ec)
        return existing;
    existing = findByKey("short_form", identifier, scope, ec);
    if (existing || ec)
        return existing;

    Json::Value input = extra.isObject() ? extra : Json::Value(Json::objectValue);
    input["name"] = identifier;
    return create(input, ec);
}

std::vector<Json::Value> LookupRepository::search(const std::string& query, std::error_code& ec) {
    ec.clear();
    std::vector<Json::Value> result;
    if (query.empty())
        return result;

    Json::Value records;
    if (!snapshot(records, ec))
        return result;
    for (const auto& r : records) {
        const std::string name = textField(r, "name");
        const std::string shortForm = textField(r, "short_form");
        if ((!name.empty() && util::containsIgnoreCase(name, query)) ||
            (!shortForm.empty() && util::containsIgnoreCase(shortForm, query)))
            result.push_back(r);
    }
    return result;
}

std::optional<Json::Value> LookupRepository::findDefault(std::error_code& ec) {
    Json::Value records;
    if (!snapshot(records, ec))
        return std::nullopt;
    for (const auto& r : records) {
        if (isDefault(r))
            return r;
    }
    return std::nullopt;
}

std::optional<Json::Value> LookupRepository::setDefaultFlag(RecordId id, bool value, std::error_code& ec) {
    std::optional<Json::Value> target;
    bool ok = mutate(
        [&](Json::Value& records, std::error_code& mec) {
            for (Json::ArrayIndex i = 0; i < records.size(); ++i) {
                if (recordId(records[i]) != id)
                    continue;
                records[i]["is_default"] = value;
                if (value)
                    onRecordWritten(records, i);
                target = records[i];
                return true;
            }
            mec = StoreErrc::NotFound;
            return false;
        },
        ec);
    if (!ok)
        return std::nullopt;
    spdlog::info("{}: {} default on id {}", entity(), value ? "set" : "cleared", id);
    return target;
}

std::optional<Json::Value> LookupRepository::setDefault(RecordId id, std::error_code& ec) {
    return setDefaultFlag(id, true, ec);
}

std::optional<Json::Value> LookupRepository::clearDefault(RecordId id, std::error_code& ec) {
    return setDefaultFlag(id, false, ec);
}

std::optional<Json::Value> LookupRepository::getSmartDefault(std::error_code& ec) {
    std::vector<UsageRecord> usage;
    if (policy_ && usage_) {
        if (!collectUsage(*policy_, usage_, usage, ec))
            return std::nullopt;
    }
    return getSmartDefault(usage, util::Clock::now(), ec);
}

std::optional<Json::Value> LookupRepository::getSmartDefault(const std::vector<UsageRecord>& usage,
                                                             util::Clock::time_point now, std::error_code& ec) {
    auto manual = findDefault(ec);
    if (manual || ec)
        return manual;

    std::vector<Json::Value> candidates = findAll(ec);
    if (ec)
        return std::nullopt;
    return pickSmartDefault(candidates, usage, policy_ ? &*policy_ : nullptr, now);
}

} // namespace DocStore
