#include <docstore/schema/SchemaRegistry.hpp>

namespace DocStore {

std::string SchemaRegistry::baseName(const std::string& entity) {
    static const std::string kExt = ".json";
    if (entity.size() > kExt.size() &&
        entity.compare(entity.size() - kExt.size(), kExt.size(), kExt) == 0)
        return entity.substr(0, entity.size() - kExt.size());
    return entity;
}

void SchemaRegistry::registerSchema(EntitySchema schema) {
    std::string key = baseName(schema.entity);
    schema.entity = key;
    schemas_[key] = std::move(schema);
}

const EntitySchema* SchemaRegistry::getSchema(const std::string& entity) const {
    auto it = schemas_.find(baseName(entity));
    return it == schemas_.end() ? nullptr : &it->second;
}

bool SchemaRegistry::isLookup(const std::string& entity) const {
    const EntitySchema* schema = getSchema(entity);
    return schema != nullptr && schema->lookup;
}

std::vector<std::string> SchemaRegistry::entities() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& kv : schemas_)
        names.push_back(kv.first);
    return names;
}

size_t SchemaRegistry::stripUnknownFields(const std::string& entity, Json::Value& record) const {
    const EntitySchema* schema = getSchema(entity);
    if (schema == nullptr || !record.isObject())
        return 0;

    size_t removed = 0;
    for (const auto& key : record.getMemberNames()) {
        if (!schema->allows(key)) {
            record.removeMember(key);
            ++removed;
        }
    }
    return removed;
}

bool SchemaRegistry::validate(const std::string& entity, const Json::Value& record,
                              std::vector<FieldViolation>& violations) const {
    const EntitySchema* schema = getSchema(entity);
    if (schema == nullptr)
        return true;

    const size_t before = violations.size();
    if (!record.isObject()) {
        violations.push_back({"", "record must be a JSON object"});
        return false;
    }

    for (const auto& name : schema->required) {
        if (!record.isMember(name))
            violations.push_back({name, "is required"});
    }

    for (const auto& key : record.getMemberNames()) {
        const FieldSpec* spec = schema->find(key);
        if (spec == nullptr) {
            violations.push_back({key, "is not an allowed field"});
            continue;
        }
        spec->check(record[key], violations);
    }
    return violations.size() == before;
}

} // namespace DocStore
