#include <docstore/repository/JsonFileRepository.hpp>
#include <docstore/repository/SmartDefault.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace DocStore {

std::optional<SmartDefaultPolicy> builtinSmartDefaultPolicy(const std::string& entity) {
    if (entity == "roasters")
        return SmartDefaultPolicy{{{"products", "roaster_id"}}, 0.7, 0.3, 30.0};

    // 추출 장비 계열: brew session 에서의 사용 빈도/최근성으로 순위를 매긴다.
    static const std::map<std::string, std::string> kBrewSessionRefs = {
        {"brew_methods", "brew_method_id"}, {"recipes", "recipe_id"}, {"grinders", "grinder_id"},
        {"filters", "filter_id"},           {"kettles", "kettle_id"}, {"scales", "scale_id"},
    };
    auto it = kBrewSessionRefs.find(entity);
    if (it != kBrewSessionRefs.end())
        return SmartDefaultPolicy{{{"brew_sessions", it->second}}, 0.6, 0.4, 7.0};

    if (entity == "brewers")
        return SmartDefaultPolicy{{{"brew_sessions", "brewer_id"}, {"shots", "brewer_id"}}, 0.6, 0.4, 7.0};

    return std::nullopt;
}

bool collectUsage(const SmartDefaultPolicy& policy, const UsageProvider& provider,
                  std::vector<UsageRecord>& usage, std::error_code& ec) {
    ec.clear();
    usage.clear();
    for (const auto& source : policy.sources) {
        std::vector<Json::Value> records;
        if (!provider(source.entity, records, ec)) {
            spdlog::error("smart default: cannot load {}: {}", source.entity, ec.message());
            return false;
        }
        for (const auto& rec : records) {
            if (!rec.isObject() || !rec[source.field].isIntegral())
                continue;
            UsageRecord u;
            u.ref = static_cast<RecordId>(rec[source.field].asInt64());
            util::Clock::time_point created;
            if (rec["created_at"].isString() && util::parseTimestamp(rec["created_at"].asString(), created))
                u.createdAt = created;
            usage.push_back(u);
        }
    }
    return true;
}

std::vector<UsageScore> scoreCandidates(const std::vector<Json::Value>& candidates,
                                        const std::vector<UsageRecord>& usage,
                                        const SmartDefaultPolicy& policy, util::Clock::time_point now) {
    std::vector<UsageScore> scores;
    scores.reserve(candidates.size());
    for (const auto& c : candidates) {
        UsageScore s;
        s.id = JsonFileRepository::recordId(c);
        for (const auto& u : usage) {
            if (u.ref != s.id)
                continue;
            ++s.frequency;
            if (u.createdAt && policy.horizonDays > 0) {
                double days = static_cast<double>(util::daysBetween(*u.createdAt, now));
                s.recency = std::max(s.recency, std::max(0.0, 1.0 - days / policy.horizonDays));
            }
        }
        s.score = policy.frequencyWeight * static_cast<double>(s.frequency) + policy.recencyWeight * s.recency;
        scores.push_back(s);
    }
    return scores;
}

namespace {

// created_at 오름차순, 같으면 id 오름차순. created_at 이 없거나 해석할 수 없으면 뒤로 보낸다.
std::vector<size_t> creationOrder(const std::vector<Json::Value>& candidates) {
    std::vector<std::pair<std::optional<util::Clock::time_point>, RecordId>> keys;
    keys.reserve(candidates.size());
    for (const auto& c : candidates) {
        std::optional<util::Clock::time_point> created;
        util::Clock::time_point tp;
        if (c["created_at"].isString() && util::parseTimestamp(c["created_at"].asString(), tp))
            created = tp;
        keys.emplace_back(created, JsonFileRepository::recordId(c));
    }

    std::vector<size_t> order(candidates.size());
    for (size_t i = 0; i < order.size(); ++i)
        order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&keys](size_t a, size_t b) {
        const auto& ka = keys[a];
        const auto& kb = keys[b];
        if (ka.first.has_value() != kb.first.has_value())
            return ka.first.has_value();
        if (ka.first && *ka.first != *kb.first)
            return *ka.first < *kb.first;
        return ka.second < kb.second;
    });
    return order;
}

} // namespace

std::optional<Json::Value> pickSmartDefault(const std::vector<Json::Value>& candidates,
                                            const std::vector<UsageRecord>& usage,
                                            const SmartDefaultPolicy* policy,
                                            util::Clock::time_point now) {
    if (candidates.empty())
        return std::nullopt;
    if (candidates.size() == 1)
        return candidates.front();

    const std::vector<size_t> order = creationOrder(candidates);
    if (policy == nullptr)
        return candidates[order.front()];

    const std::vector<UsageScore> scores = scoreCandidates(candidates, usage, *policy, now);
    size_t best = order.front();
    for (size_t idx : order) {
        if (scores[idx].score > scores[best].score)
            best = idx;
    }
    spdlog::debug("smart default: id {} (frequency {}, recency {:.2f}, score {:.2f})", scores[best].id,
                  scores[best].frequency, scores[best].recency, scores[best].score);
    return candidates[best];
}

} // namespace DocStore
