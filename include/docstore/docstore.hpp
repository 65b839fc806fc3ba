#pragma once
/// @file docstore.hpp
/// @brief Umbrella header for the docstore library

#include "config/StoreConfig.hpp"
#include "migration/BuiltinMigrations.hpp"
#include "migration/MigrationManager.hpp"
#include "migration/Version.hpp"
#include "record/LookupItem.hpp"
#include "record/RecordBase.hpp"
#include "repository/JsonFileRepository.hpp"
#include "repository/LookupRepository.hpp"
#include "repository/RecordRepository.hpp"
#include "repository/SmartDefault.hpp"
#include "repository/TypedRepository.hpp"
#include "schema/SchemaRegistry.hpp"
#include "tenant/TenantRegistry.hpp"
#include "util/StoreError.hpp"
