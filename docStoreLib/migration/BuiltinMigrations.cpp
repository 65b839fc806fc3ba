#include <docstore/migration/BuiltinMigrations.hpp>
#include <docstore/util/TimeUtil.hpp>
#include <docstore/util/textUtil.hpp>

#include <spdlog/spdlog.h>

#include <map>

namespace DocStore {

namespace {

const char* const kDenormalizedProductFields[] = {"roaster", "bean_type", "country", "region", "decaf_method"};

// null -> [], 정수 -> [정수], 배열은 그대로, 그 외 타입은 []
Json::Value asIdArray(const Json::Value& v) {
    if (v.isArray())
        return v;
    Json::Value out(Json::arrayValue);
    if (v.isIntegral())
        out.append(v);
    return out;
}

bool hasDenormalizedFields(const Json::Value& product) {
    for (const char* f : kDenormalizedProductFields) {
        if (product.isMember(f))
            return true;
    }
    return false;
}

void normalizeProducts(Json::Value& products, const std::map<std::string, long long>& regionIds) {
    for (auto& product : products) {
        const Json::Value region = product.get("region", Json::Value());
        if (region.isString() && regionIds.count(region.asString()) != 0) {
            Json::Value ids(Json::arrayValue);
            ids.append(Json::Int64(regionIds.at(region.asString())));
            product["region_id"] = ids;
        } else {
            product["region_id"] = asIdArray(product["region_id"]);
        }
        product["bean_type_id"] = asIdArray(product["bean_type_id"]);
        for (const char* f : kDenormalizedProductFields)
            product.removeMember(f);
    }
}

} // namespace

bool migrateExtractRegions(const MigrationContext& ctx, std::error_code& ec) {
    ec.clear();
    Json::Value products;
    if (!ctx.load("products", products, ec))
        return false;

    if (ctx.exists("regions")) {
        // 이미 적용된 상태: 남아 있는 비정규 필드만 정리한다.
        bool dirty = false;
        for (const auto& p : products)
            dirty = dirty || hasDenormalizedFields(p);
        if (!dirty) {
            spdlog::info("1.2->1.3: regions.json exists and products are clean, nothing to do");
            return true;
        }
        normalizeProducts(products, {});
        return ctx.store("products", products, ec);
    }

    Json::Value countries;
    if (!ctx.load("countries", countries, ec))
        return false;
    if (products.empty() && countries.empty()) {
        spdlog::info("1.2->1.3: no data found, skipped");
        return true;
    }

    // 지역명 -> country_id. 처음 등장한 제품의 country_id를 사용한다.
    std::map<std::string, long long> regionCountry;
    for (const auto& p : products) {
        const Json::Value& region = p["region"];
        const Json::Value& countryId = p["country_id"];
        if (!region.isString() || util::trim(region.asString()).empty())
            continue;
        if (!countryId.isIntegral() || countryId.asInt64() == 0)
            continue;
        regionCountry.emplace(region.asString(), static_cast<long long>(countryId.asInt64()));
    }

    Json::Value regions(Json::arrayValue);
    std::map<std::string, long long> regionIds;
    const std::string now = util::nowTimestamp();
    long long nextId = 1;
    for (const auto& [name, countryId] : regionCountry) {
        Json::Value r(Json::objectValue);
        r["id"] = Json::Int64(nextId);
        r["name"] = name;
        r["country_id"] = Json::Int64(countryId);
        r["is_default"] = false;
        r["created_at"] = now;
        r["updated_at"] = now;
        regions.append(r);
        regionIds[name] = nextId++;
    }
    if (!ctx.store("regions", regions, ec))
        return false;
    spdlog::info("1.2->1.3: created regions.json with {} region(s)", regions.size());

    normalizeProducts(products, regionIds);
    return ctx.store("products", products, ec);
}

bool migrateAddEspressoCollections(const MigrationContext& ctx, std::error_code& ec) {
    ec.clear();
    static const char* const kNew[] = {"shots",   "shot_sessions", "brewers",   "portafilters",
                                       "baskets", "tampers",       "wdt_tools", "leveling_tools"};
    for (const char* entity : kNew) {
        if (ctx.exists(entity)) {
            spdlog::debug("1.3->1.4: {}.json already exists", entity);
            continue;
        }
        if (!ctx.store(entity, Json::Value(Json::arrayValue), ec))
            return false;
        spdlog::info("1.3->1.4: created {}.json", entity);
    }
    return true;
}

bool migrateValidationRulesOnly(const MigrationContext&, std::error_code& ec) {
    ec.clear();
    return true;
}

Json::Value mapBeanProcess(const Json::Value& legacy) {
    if (legacy.isArray())
        return legacy;

    static const std::map<std::string, std::vector<const char*>> kMapping = {
        {"Washed", {"Washed (wet)"}},
        {"Vasket", {"Washed (wet)"}},
        {"Natural", {"Natural (dry)"}},
        {"Natural/Anaerobic", {"Natural (dry)", "Anaerobic"}},
        {"Honey", {"Honey"}},
        {"Washed, Natural", {"Washed (wet)", "Natural (dry)"}},
        {"Dried", {"Natural (dry)"}},
        {"Dried whole beans", {"Natural (dry)"}},
        {"Sun dried", {"Natural (dry)"}},
        {"Dried with and without fruit", {"Other"}},
    };

    Json::Value out(Json::arrayValue);
    if (legacy.isNull())
        return out;
    if (legacy.isString()) {
        const std::string s = legacy.asString();
        auto it = kMapping.find(s);
        if (it != kMapping.end()) {
            for (const char* v : it->second)
                out.append(v);
            return out;
        }
        if (util::trim(s).empty())
            return out;
    }
    out.append("Other");
    return out;
}

bool migrateBeanProcessToArray(const MigrationContext& ctx, std::error_code& ec) {
    ec.clear();
    if (!ctx.exists("products")) {
        spdlog::info("1.5->1.6: no products.json, skipped");
        return true;
    }
    Json::Value products;
    if (!ctx.load("products", products, ec))
        return false;

    size_t changed = 0;
    for (auto& p : products) {
        if (!p.isMember("bean_process") || p["bean_process"].isArray())
            continue;
        const Json::Value legacy = p["bean_process"];
        Json::Value mapped = mapBeanProcess(legacy);
        if (legacy.isString() && mapped.size() == 1 && mapped[0u].asString() == "Other" &&
            legacy.asString() != "Dried with and without fruit")
            spdlog::warn("1.5->1.6: product {} has unknown bean_process '{}', mapped to Other",
                         p.get("id", Json::Value()).asString(), legacy.asString());
        p["bean_process"] = mapped;
        ++changed;
    }
    if (changed == 0)
        return true;
    spdlog::info("1.5->1.6: converted bean_process on {} product(s)", changed);
    return ctx.store("products", products, ec);
}

void registerBuiltinMigrations(MigrationManager& manager) {
    manager.registerMigration({"1.2", "1.3", "separate regions lookup, schema-compliant products", true,
                               migrateExtractRegions});
    manager.registerMigration(
        {"1.3", "1.4", "espresso collections", false, migrateAddEspressoCollections});
    manager.registerMigration({"1.4", "1.5", "validation rules only", false, migrateValidationRulesOnly});
    manager.registerMigration({"1.5", "1.6", "bean_process as array of standard process names", true,
                               migrateBeanProcessToArray});
}

} // namespace DocStore
