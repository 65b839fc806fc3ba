#pragma once
/// @file LookupItem.hpp
/// @brief Typed record for lookup collections

#include "RecordBase.hpp"

#include <optional>
#include <string>

namespace DocStore {

/// @brief Common lookup fields as members, entity-specific fields in `extra`
class LookupItem : public RecordBase {
  public:
    long long itemId = 0;                   ///< 0 until stored
    std::string name;                       ///< Required, non-empty
    std::optional<std::string> shortForm;   ///< Abbreviation, e.g. "V60"
    std::optional<std::string> description;
    std::optional<std::string> notes;
    bool isDefault = false;
    std::string createdAt;                  ///< Stamped by the engine
    std::string updatedAt;                  ///< Stamped by the engine
    Json::Value extra{Json::objectValue};   ///< Entity-specific fields (brand, country_id, ...)

    LookupItem() = default;
    explicit LookupItem(std::string entity) : entity_(std::move(entity)) {}
    LookupItem(std::string entity, std::string itemName)
        : name(std::move(itemName)), entity_(std::move(entity)) {}

    long long id() const override { return itemId; }
    const char* entityType() const override { return entity_.c_str(); }

    std::unique_ptr<RecordBase> clone() const override { return std::make_unique<LookupItem>(*this); }

    void toJson(Json::Value& out) const override;
    bool fromJson(const Json::Value& in, std::error_code& ec) override;

  private:
    std::string entity_;
};

} // namespace DocStore
