#pragma once
/// @file StoreError.hpp
/// @brief Error codes of the document store (std::error_code integration)

#include <string>
#include <system_error>
#include <type_traits>

namespace DocStore {

/// @brief Store-level failure conditions
/// @details OS-level failures keep their errno value in std::generic_category().
///          Values below are reported through the "docstore" category.
enum class StoreErrc {
    NotFound = 1,      ///< Required record id does not exist
    ValidationFailed,  ///< Record violates its entity schema
    LockTimeout,       ///< Exclusive collection lock not acquired in time
    MigrationFailed,   ///< A migration step failed, data version unchanged
    NoMigrationPath,   ///< No registered edge between data and schema version
    InvalidTenant,     ///< Tenant identifier rejected by the allowlist
    CorruptCollection, ///< Collection file is not a JSON array of objects
    NotALookup,        ///< Entity type is not a lookup collection
};

/// @brief Returns the singleton category for StoreErrc
const std::error_category& storeCategory() noexcept;

/// @brief ADL hook used by std::error_code's converting constructor
inline std::error_code make_error_code(StoreErrc e) noexcept {
    return std::error_code(static_cast<int>(e), storeCategory());
}

} // namespace DocStore

namespace std {
template <> struct is_error_code_enum<DocStore::StoreErrc> : true_type {};
} // namespace std
