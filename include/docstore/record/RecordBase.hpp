#pragma once
/// @file RecordBase.hpp
/// @brief Base interface for statically typed records

#include <json/json.h>

#include <memory>
#include <system_error>

namespace DocStore {

/// @brief Base interface for typed records stored in collection files
/// @details A typed record declares its fields as members and converts
///          to and from the JSON object form the storage engine persists.
///          Stored fields the type does not model are not carried over.
class RecordBase {
  public:
    /// @brief Virtual destructor
    virtual ~RecordBase() = default;

    /// @brief Record id, 0 for a record that has not been stored yet
    virtual long long id() const = 0;

    /// @brief Entity type this record belongs to, e.g. "grinders"
    virtual const char* entityType() const = 0;

    /// @brief Serialize to a JSON object
    /// @param[out] out Receives the record's fields
    virtual void toJson(Json::Value& out) const = 0;

    /// @brief Restore from a stored JSON object
    /// @param[in] in Stored record
    /// @param[out] ec Error code set on failure
    /// @return true on success
    virtual bool fromJson(const Json::Value& in, std::error_code& ec) = 0;

    /// @brief Clone object (Deep Copy)
    virtual std::unique_ptr<RecordBase> clone() const = 0;
};

} // namespace DocStore
