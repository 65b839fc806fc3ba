#pragma once
/// @file JsonIo.hpp
/// @brief jsoncpp serialization helpers for collection and marker files

#include <json/json.h>

#include <string>
#include <system_error>

namespace DocStore::util {

/// @brief Pretty-printed UTF-8 JSON text (two-space indentation, trailing newline)
std::string toJsonText(const Json::Value& value);

/// @brief Parse JSON text
/// @param text Input text
/// @param out Parsed value
/// @param errors Parser diagnostics on failure
/// @return true on success
bool parseJsonText(const std::string& text, Json::Value& out, std::string& errors);

/// @brief Read and parse a JSON file
/// @param ec errno for I/O failures, StoreErrc::CorruptCollection for malformed JSON
bool readJsonFile(const std::string& path, Json::Value& out, std::error_code& ec);

/// @brief Serialize and atomically replace a JSON file
bool writeJsonFileAtomic(const std::string& path, const Json::Value& value, std::error_code& ec);

} // namespace DocStore::util
