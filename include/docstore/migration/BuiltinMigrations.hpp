#pragma once
/// @file BuiltinMigrations.hpp
/// @brief Shipped data migrations of the record-keeping application

#include "MigrationManager.hpp"

#include <string>
#include <vector>

namespace DocStore {

/// @brief Register 1.2->1.3, 1.3->1.4, 1.4->1.5 and 1.5->1.6
void registerBuiltinMigrations(MigrationManager& manager);

/// @brief 1.2->1.3: move product regions into regions.json and normalize product references
/// @details Region names become lookup records (ids assigned in name order)
///          linked to the product's country_id. region_id and bean_type_id
///          become arrays and the denormalized name fields roaster,
///          bean_type, country, region and decaf_method are removed.
///          When regions.json already exists only leftover name fields are cleaned.
bool migrateExtractRegions(const MigrationContext& ctx, std::error_code& ec);

/// @brief 1.3->1.4: create the espresso collections that do not exist yet
bool migrateAddEspressoCollections(const MigrationContext& ctx, std::error_code& ec);

/// @brief 1.4->1.5: validation-rule change only, data is untouched
bool migrateValidationRulesOnly(const MigrationContext& ctx, std::error_code& ec);

/// @brief 1.5->1.6: products.bean_process string -> array of standard process names
bool migrateBeanProcessToArray(const MigrationContext& ctx, std::error_code& ec);

/// @brief Standard process names for a legacy bean_process value
/// @details null and blank -> []. Known spellings map through a fixed table,
///          any other non-empty value -> ["Other"]. Arrays are returned unchanged.
Json::Value mapBeanProcess(const Json::Value& legacy);

} // namespace DocStore
