#include <docstore/record/LookupItem.hpp>

namespace DocStore {

namespace {

void putOptional(Json::Value& out, const char* key, const std::optional<std::string>& v) {
    if (v)
        out[key] = *v;
}

bool readOptional(const Json::Value& in, const char* key, std::optional<std::string>& v) {
    const Json::Value& j = in[key];
    if (j.isNull()) {
        v.reset();
        return true;
    }
    if (!j.isString())
        return false;
    v = j.asString();
    return true;
}

const char* const kModeled[] = {"id",    "name",       "short_form", "description",
                                "notes", "is_default", "created_at", "updated_at"};

bool isModeled(const std::string& key) {
    for (const char* m : kModeled) {
        if (key == m)
            return true;
    }
    return false;
}

} // namespace

void LookupItem::toJson(Json::Value& out) const {
    // extra 를 먼저 넣고 모델링된 필드로 덮어쓴다.
    out = extra.isObject() ? extra : Json::Value(Json::objectValue);
    if (itemId > 0)
        out["id"] = Json::Int64(itemId);
    out["name"] = name;
    putOptional(out, "short_form", shortForm);
    putOptional(out, "description", description);
    putOptional(out, "notes", notes);
    out["is_default"] = isDefault;
    if (!createdAt.empty())
        out["created_at"] = createdAt;
    if (!updatedAt.empty())
        out["updated_at"] = updatedAt;
}

bool LookupItem::fromJson(const Json::Value& in, std::error_code& ec) {
    ec.clear();
    if (!in.isObject() || !in["name"].isString()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    const Json::Value& id = in["id"];
    if (!id.isNull() && !id.isIntegral()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    LookupItem next(entity_);
    next.itemId = id.isNull() ? 0 : static_cast<long long>(id.asInt64());
    next.name = in["name"].asString();
    if (!readOptional(in, "short_form", next.shortForm) || !readOptional(in, "description", next.description) ||
        !readOptional(in, "notes", next.notes)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    next.isDefault = in["is_default"].isBool() && in["is_default"].asBool();
    next.createdAt = in["created_at"].isString() ? in["created_at"].asString() : std::string();
    next.updatedAt = in["updated_at"].isString() ? in["updated_at"].asString() : std::string();
    for (const auto& key : in.getMemberNames()) {
        if (!isModeled(key))
            next.extra[key] = in[key];
    }

    *this = std::move(next);
    return true;
}

} // namespace DocStore
