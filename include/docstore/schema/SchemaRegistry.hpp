#pragma once
/// @file SchemaRegistry.hpp
/// @brief Closed schema per entity type: lookup, unknown-field stripping, validation

#include "FieldSpec.hpp"

#include <json/json.h>

#include <map>
#include <string>
#include <vector>

namespace DocStore {

/// @brief Immutable-after-setup table of entity schemas
///
/// An entity type without a registered schema is unmodeled: stripping and
/// validation are both skipped for it.
///
/// @note Registration is not thread-safe. Register everything before handing
///       the registry to repositories, then only call the const members.
class SchemaRegistry {
  public:
    SchemaRegistry() = default;

    /// @brief Registry preloaded with the record-keeping application's catalog
    static SchemaRegistry withBuiltinSchemas();

    /// @brief Add or replace the schema of schema.entity
    void registerSchema(EntitySchema schema);

    /// @brief Schema of an entity type, nullptr when unmodeled
    /// @param entity Entity name, with or without a trailing ".json"
    const EntitySchema* getSchema(const std::string& entity) const;

    /// @brief True when the entity is registered as a lookup collection
    bool isLookup(const std::string& entity) const;

    /// @brief Registered entity names in ascending order
    std::vector<std::string> entities() const;

    /// @brief Remove every member of `record` not in the entity's allow-list
    /// @return Number of removed fields (0 for unmodeled entities)
    size_t stripUnknownFields(const std::string& entity, Json::Value& record) const;

    /// @brief Check required fields and field constraints
    /// @param violations Receives one entry per offending field/constraint
    /// @return true if the record satisfies the schema or the entity is unmodeled
    bool validate(const std::string& entity, const Json::Value& record,
                  std::vector<FieldViolation>& violations) const;

  private:
    static std::string baseName(const std::string& entity);

    std::map<std::string, EntitySchema> schemas_;
};

} // namespace DocStore
