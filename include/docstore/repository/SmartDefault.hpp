#pragma once
/// @file SmartDefault.hpp
/// @brief Usage-based ranking of lookup records (frequency and recency)

#include "../util/TimeUtil.hpp"
#include "RecordRepository.hpp"

#include <json/json.h>

#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace DocStore {

/// @brief A field of another entity that references lookup ids
struct UsageSource {
    std::string entity; ///< Referencing entity type, e.g. "brew_sessions"
    std::string field;  ///< Reference field, e.g. "grinder_id"
};

/// @brief How a lookup entity ranks its records
struct SmartDefaultPolicy {
    std::vector<UsageSource> sources;
    double frequencyWeight = 0.6;
    double recencyWeight = 0.4;
    double horizonDays = 7.0; ///< Recency decays linearly to 0 over this many days
};

/// @brief One reference to a lookup record
struct UsageRecord {
    RecordId ref = -1;                                ///< Referenced lookup id
    std::optional<util::Clock::time_point> createdAt; ///< Creation time of the referencing record
};

/// @brief Computed score of one candidate
struct UsageScore {
    RecordId id = -1;
    long frequency = 0;
    double recency = 0.0;
    double score = 0.0;
};

/// @brief Loads every record of a referencing entity type
using UsageProvider =
    std::function<bool(const std::string& entity, std::vector<Json::Value>& records, std::error_code& ec)>;

/// @brief Policy for a lookup entity of the record-keeping application
/// @return nullopt for lookups ranked by creation order only
std::optional<SmartDefaultPolicy> builtinSmartDefaultPolicy(const std::string& entity);

/// @brief Extract references from referencing records through every source of the policy
/// @details Records without an integral reference field are skipped.
bool collectUsage(const SmartDefaultPolicy& policy, const UsageProvider& provider,
                  std::vector<UsageRecord>& usage, std::error_code& ec);

/// @brief frequency/recency/score for every candidate, in candidate order
/// @details frequency is the number of references. recency is
///          max(0, 1 - days/horizon) over the newest reference, where days
///          is the whole number of days elapsed.
std::vector<UsageScore> scoreCandidates(const std::vector<Json::Value>& candidates,
                                        const std::vector<UsageRecord>& usage,
                                        const SmartDefaultPolicy& policy, util::Clock::time_point now);

/// @brief Pick the preferred candidate
/// @details Empty -> nullopt. A single candidate always wins. Otherwise the
///          highest score wins and ties go to the earliest-created record.
///          Without a policy the earliest-created record is returned.
std::optional<Json::Value> pickSmartDefault(const std::vector<Json::Value>& candidates,
                                            const std::vector<UsageRecord>& usage,
                                            const SmartDefaultPolicy* policy,
                                            util::Clock::time_point now);

} // namespace DocStore
