#pragma once
/// @file LookupRepository.hpp
/// @brief Lookup-table repository: name dedup, single default, smart default

#include "JsonFileRepository.hpp"
#include "SmartDefault.hpp"

#include <optional>

namespace DocStore {

/// @brief Repository for lookup collections (roasters, grinders, ...)
/// @details At most one record carries `is_default = true`. Every write that
///          sets the flag clears it on all other records inside the same
///          locked write cycle.
class LookupRepository : public JsonFileRepository {
  public:
    /// @param policy Smart-default ranking, nullopt ranks by creation order only
    /// @param usage Loads referencing records for the policy's sources (may be empty without a policy)
    LookupRepository(std::string entity, const std::string& dir, std::shared_ptr<const SchemaRegistry> schemas,
                     const StoreConfig& config, std::optional<SmartDefaultPolicy> policy = std::nullopt,
                     UsageProvider usage = nullptr);

    /// @brief Exact match on name, ignoring case and surrounding whitespace
    std::optional<Json::Value> findByName(const std::string& name, std::error_code& ec);

    /// @brief Exact match on short_form, ignoring case and surrounding whitespace
    std::optional<Json::Value> findByShortForm(const std::string& shortForm, std::error_code& ec);

    /// @brief findByName, then findByShortForm
    std::optional<Json::Value> findByNameOrShortForm(const std::string& identifier, std::error_code& ec);

    /// @brief Existing record with this name, or a new one built from `extra` plus the name
    /// @details Required fields other than name that `extra` carries (a region's
    ///          country_id) must match too, so "Huila" in two countries stays two records.
    std::optional<Json::Value> getOrCreate(const std::string& name, const Json::Value& extra,
                                           std::error_code& ec);

    /// @brief Like getOrCreate, but also matches short_form before creating
    std::optional<Json::Value> getOrCreateByIdentifier(const std::string& identifier, const Json::Value& extra,
                                                       std::error_code& ec);

    /// @brief Case-insensitive substring match over name and short_form
    std::vector<Json::Value> search(const std::string& query, std::error_code& ec);

    /// @brief The record marked default, if any
    std::optional<Json::Value> findDefault(std::error_code& ec);

    /// @brief Mark `id` default and clear the flag everywhere else (one locked write)
    /// @param ec StoreErrc::NotFound if the id does not exist
    std::optional<Json::Value> setDefault(RecordId id, std::error_code& ec);

    /// @brief Clear the default flag on exactly `id`
    /// @param ec StoreErrc::NotFound if the id does not exist
    std::optional<Json::Value> clearDefault(RecordId id, std::error_code& ec);

    /// @brief Manual default if set, otherwise the usage-ranked choice
    std::optional<Json::Value> getSmartDefault(std::error_code& ec);

    /// @brief Smart default computed from caller-supplied usage at `now`
    std::optional<Json::Value> getSmartDefault(const std::vector<UsageRecord>& usage, util::Clock::time_point now,
                                               std::error_code& ec);

    const std::optional<SmartDefaultPolicy>& policy() const noexcept { return policy_; }

  protected:
    void onRecordWritten(Json::Value& records, Json::ArrayIndex index) override;

  private:
    std::optional<Json::Value> findByKey(const char* field, const std::string& value, std::error_code& ec);
    std::optional<Json::Value> findByKey(const char* field, const std::string& value, const Json::Value& scope,
                                         std::error_code& ec);
    /// @brief Required non-name fields of `extra` that take part in record identity
    Json::Value identityScope(const Json::Value& extra) const;
    std::optional<Json::Value> setDefaultFlag(RecordId id, bool value, std::error_code& ec);

    std::optional<SmartDefaultPolicy> policy_;
    UsageProvider usage_;
};

} // namespace DocStore
