#pragma once
/// @file RecordRepository.hpp
/// @brief Repository interface over one entity-type collection

#include "../schema/FieldSpec.hpp"

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace DocStore {

/// @brief Record identifier, unique and never reused within its collection
using RecordId = long long;

/// @brief Record repository interface
/// @details Records are JSON objects. Every returned record is an independent
///          copy, so callers may modify it freely without touching stored state.
class RecordRepository {
  public:
    virtual ~RecordRepository() = default;

    // =========================================================================
    // CRUD Operations
    // =========================================================================

    /// @brief Insert a new record
    /// @param input Field values (unknown fields are dropped, id and timestamps are assigned)
    /// @param violations Receives every schema violation when validation fails (may be nullptr)
    /// @param ec StoreErrc::ValidationFailed, StoreErrc::LockTimeout or an errno value
    /// @return Stored record, or nullopt on failure
    virtual std::optional<Json::Value> create(const Json::Value& input,
                                              std::vector<FieldViolation>* violations,
                                              std::error_code& ec) = 0;

    /// @brief Merge `input` over the record with `id`
    /// @param violations Receives every schema violation when validation fails (may be nullptr)
    /// @param ec Cleared when the id does not exist
    /// @return Updated record, nullopt when not found or on failure
    virtual std::optional<Json::Value> update(RecordId id, const Json::Value& input,
                                              std::vector<FieldViolation>* violations,
                                              std::error_code& ec) = 0;

    /// @brief Delete record by ID
    /// @return true if a record was removed, false if not found or on failure
    virtual bool deleteById(RecordId id, std::error_code& ec) = 0;

    /// @brief Find record by ID
    /// @return Found record, nullopt when absent (ec cleared) or on failure
    virtual std::optional<Json::Value> findById(RecordId id, std::error_code& ec) = 0;

    /// @brief Find all records in file order
    virtual std::vector<Json::Value> findAll(std::error_code& ec) = 0;

    /// @brief Get record count
    virtual size_t count(std::error_code& ec) = 0;

    /// @brief Check if record exists by ID
    virtual bool existsById(RecordId id, std::error_code& ec) = 0;

    /// @brief Drop any cached collection content unconditionally
    virtual void invalidate() = 0;

    std::optional<Json::Value> create(const Json::Value& input, std::error_code& ec) {
        return create(input, nullptr, ec);
    }

    std::optional<Json::Value> update(RecordId id, const Json::Value& input, std::error_code& ec) {
        return update(id, input, nullptr, ec);
    }
};

} // namespace DocStore
