#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <docstore/docstore.hpp>

using namespace DocStore;

// =============================================================================
// Helper Macros for Walkthrough Output
// =============================================================================

#define DEMO_SECTION(name) std::cout << "\n=== " << name << " ===\n"
#define DEMO_CASE(name) std::cout << "\n--- " << name << " ---\n"
#define DEMO_PASS(msg) std::cout << "[PASS] " << msg << "\n"
#define DEMO_FAIL(msg) std::cout << "[FAIL] " << msg << "\n"
#define CHECK_EC(ec, context)                                                                      \
    if (ec) {                                                                                      \
        DEMO_FAIL(context << ": " << ec.message());                                                \
        return;                                                                                    \
    }

// =============================================================================
// Generic collection
// =============================================================================

void demoProducts(TenantRegistry& store) {
    DEMO_SECTION("Products (generic collection)");
    std::error_code ec;

    auto products = store.getDefaultRepository("products", ec);
    CHECK_EC(ec, "Open products");

    DEMO_CASE("Create");
    Json::Value input(Json::objectValue);
    input["product_name"] = "Ethiopia Guji";
    input["rating"] = 4.5;
    input["roaster"] = "derived name, not stored";
    auto created = products->create(input, ec);
    CHECK_EC(ec, "Create product");
    std::cout << "Created id=" << (*created)["id"].asInt64()
              << " has roaster field: " << std::boolalpha << created->isMember("roaster") << "\n";
    DEMO_PASS("Unknown field stripped before storing");

    DEMO_CASE("Validation");
    Json::Value bad(Json::objectValue);
    bad["product_name"] = "Bad rating";
    bad["rating"] = 4.3;
    std::vector<FieldViolation> violations;
    auto rejected = products->create(bad, &violations, ec);
    if (!rejected && ec == StoreErrc::ValidationFailed) {
        DEMO_PASS("Rejected: " + describeViolations(violations));
    } else {
        DEMO_FAIL("rating 4.3 should not validate");
    }

    DEMO_CASE("Update");
    Json::Value patch(Json::objectValue);
    patch["notes"] = "floral, bergamot";
    auto updated = products->update((*created)["id"].asInt64(), patch, ec);
    CHECK_EC(ec, "Update product");
    if (updated && (*updated)["created_at"] == (*created)["created_at"]) {
        DEMO_PASS("created_at preserved, updated_at refreshed");
    }

    std::cout << "\nProduct count: " << products->count(ec) << "\n";
}

// =============================================================================
// Lookup collection
// =============================================================================

void demoGrinders(TenantRegistry& store) {
    DEMO_SECTION("Grinders (lookup collection)");
    std::error_code ec;

    auto grinders = store.getDefaultLookupRepository("grinders", ec);
    CHECK_EC(ec, "Open grinders");

    DEMO_CASE("getOrCreate");
    Json::Value extra(Json::objectValue);
    extra["brand"] = "Comandante";
    auto c40 = grinders->getOrCreate("C40", extra, ec);
    CHECK_EC(ec, "getOrCreate C40");
    auto again = grinders->getOrCreate("  c40 ", Json::Value(), ec);
    CHECK_EC(ec, "getOrCreate c40 again");
    if ((*again)["id"] == (*c40)["id"]) {
        DEMO_PASS("Name match ignores case and whitespace");
    }

    auto niche = grinders->getOrCreate("Niche Zero", Json::Value(), ec);
    CHECK_EC(ec, "getOrCreate Niche");

    DEMO_CASE("Smart default");
    auto sessions = store.getDefaultRepository("brew_sessions", ec);
    CHECK_EC(ec, "Open brew_sessions");
    for (int i = 0; i < 3; ++i) {
        Json::Value s(Json::objectValue);
        s["grinder_id"] = (*niche)["id"];
        s["amount_coffee_grams"] = 15;
        sessions->create(s, ec);
        CHECK_EC(ec, "Create brew session");
    }
    auto smart = grinders->getSmartDefault(ec);
    CHECK_EC(ec, "Smart default");
    std::cout << "Smart default: " << (*smart)["name"].asString() << "\n";

    DEMO_CASE("Manual default wins");
    grinders->setDefault((*c40)["id"].asInt64(), ec);
    CHECK_EC(ec, "setDefault");
    smart = grinders->getSmartDefault(ec);
    CHECK_EC(ec, "Smart default after setDefault");
    std::cout << "Smart default: " << (*smart)["name"].asString() << "\n";
}

// =============================================================================
// Typed records
// =============================================================================

void demoTyped(TenantRegistry& store) {
    DEMO_SECTION("Typed lookup records");
    std::error_code ec;

    auto raw = store.getDefaultRepository("kettles", ec);
    CHECK_EC(ec, "Open kettles");
    TypedRepository<LookupItem> kettles(raw, LookupItem("kettles"));

    LookupItem stagg("kettles", "Stagg EKG");
    stagg.extra["brand"] = "Fellow";
    auto stored = kettles.create(stagg, ec);
    CHECK_EC(ec, "Create kettle");
    std::cout << "Stored kettle id=" << stored->id() << " brand=" << stored->extra["brand"].asString() << "\n";

    auto all = kettles.findAll(ec);
    CHECK_EC(ec, "FindAll kettles");
    for (const auto& k : all)
        std::cout << "  - " << k->name << " (id=" << k->id() << ")\n";
}

// =============================================================================
// Tenants and migration
// =============================================================================

void demoTenants(TenantRegistry& store) {
    DEMO_SECTION("Tenants");
    std::error_code ec;

    auto roasters = store.getLookupRepository("test_demo", "roasters", ec);
    CHECK_EC(ec, "Open tenant roasters");
    roasters->getOrCreate("Tim Wendelboe", Json::Value(), ec);
    CHECK_EC(ec, "Create tenant roaster");

    auto rejected = store.getRepository("../escape", "roasters", ec);
    if (!rejected && ec == StoreErrc::InvalidTenant) {
        DEMO_PASS("Path traversal tenant id rejected");
    }

    DEMO_CASE("Migration");
    store.migrateTenant("test_demo", ec);
    if (ec) {
        std::cout << "migration: " << ec.message() << "\n";
    } else {
        DEMO_PASS("Tenant data is at the schema version");
    }

    size_t removed = store.cleanupEphemeralTenants(ec);
    CHECK_EC(ec, "Cleanup");
    std::cout << "Ephemeral tenants removed: " << removed << "\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    StoreConfig config;
    config.dataDir = "./demo_data";
    config.lockDir = "./demo_data/.locks";

    if (argc > 1) {
        std::error_code ec;
        if (!loadStoreConfig(argv[1], config, ec)) {
            std::cerr << "config " << argv[1] << ": " << ec.message() << "\n";
            return 1;
        }
    }
    std::error_code envEc;
    if (!applyEnvironment(config, envEc)) {
        std::cerr << "environment: " << envEc.message() << "\n";
        return 1;
    }
    applyLogLevel(config);

    std::cout << "========================================\n";
    std::cout << "    docstore walkthrough\n";
    std::cout << "========================================\n";
    spdlog::info("data directory: {}", config.dataDir);

    auto schemas = std::make_shared<const SchemaRegistry>(SchemaRegistry::withBuiltinSchemas());
    TenantRegistry store(config, schemas);

    demoProducts(store);
    demoGrinders(store);
    demoTyped(store);
    demoTenants(store);

    std::cout << "\n========================================\n";
    std::cout << "    Walkthrough Completed\n";
    std::cout << "========================================\n";
    return 0;
}
