/**
 * @file tests/scenario/MigrationScenarioTest.cpp
 * @brief 데이터 버전 마커와 내장 마이그레이션 실행 시나리오.
 * @details
 * - 성공 시에만 data_version.json 이 갱신되는지, 실패 시 이전 값이 남는지 확인합니다.
 * - 데이터 구조를 바꾸는 단계는 실행 전에 backup_* 디렉터리를 남겨야 합니다.
 */

#include <gtest/gtest.h>

#include <docstore/migration/BuiltinMigrations.hpp>
#include <docstore/migration/MigrationManager.hpp>
#include <docstore/util/JsonIo.hpp>
#include <docstore/util/StoreError.hpp>

#include "TestUtil.hpp"

#include <stdexcept>

using namespace DocStore;
using DocStoreTest::readText;
using DocStoreTest::writeText;
namespace fs = std::filesystem;

class MigrationScenarioTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_ = dir_.config();
        fs::create_directories(config_.dataDir);
    }

    void declareSchema(const std::string& version) {
        writeText(config_.schemaVersionFile, "{\"schema_version\": \"" + version + "\"}");
    }

    void markData(const std::string& version) {
        writeText(dataFile("data_version.json"), "{\"version\": \"" + version + "\"}");
    }

    std::string dataFile(const std::string& name) const { return (fs::path(config_.dataDir) / name).string(); }

    Json::Value load(const std::string& entity) {
        Json::Value v;
        std::error_code ec;
        EXPECT_TRUE(util::readJsonFile(dataFile(entity + ".json"), v, ec)) << entity << ": " << ec.message();
        return v;
    }

    void save(const std::string& entity, const std::string& text) { writeText(dataFile(entity + ".json"), text); }

    std::vector<std::string> backups() const {
        std::vector<std::string> out;
        for (const auto& e : fs::directory_iterator(config_.dataDir)) {
            const std::string name = e.path().filename().string();
            if (e.is_directory() && name.rfind("backup_", 0) == 0)
                out.push_back(e.path().string());
        }
        return out;
    }

    std::string dataVersion(MigrationManager& m) {
        std::string v;
        std::error_code ec;
        EXPECT_TRUE(m.getDataVersion(v, ec)) << ec.message();
        return v;
    }

    MigrationManager builtin() {
        MigrationManager m(config_.dataDir, config_);
        registerBuiltinMigrations(m);
        return m;
    }

    DocStoreTest::ScratchDir dir_{"migration"};
    StoreConfig config_;
};

// =============================================================================
// Version markers
// =============================================================================

TEST_F(MigrationScenarioTest, MarkerDefaults) {
    MigrationManager m = builtin();
    std::error_code ec;

    std::string schema;
    ASSERT_TRUE(m.getSchemaVersion(schema, ec));
    EXPECT_EQ(schema, "0.0");
    EXPECT_EQ(dataVersion(m), "1.0");
    EXPECT_FALSE(m.needsMigration(ec));
    EXPECT_FALSE(ec);

    // 마이그레이션할 것이 없으면 아무 파일도 만들지 않는다.
    EXPECT_TRUE(m.runMigrations(ec));
    EXPECT_FALSE(fs::exists(dataFile("data_version.json")));
}

TEST_F(MigrationScenarioTest, SchemaFileAcceptsLegacyVersionKey) {
    writeText(config_.schemaVersionFile, R"({"version": "1.5"})");
    MigrationManager m = builtin();
    std::string schema;
    std::error_code ec;
    ASSERT_TRUE(m.getSchemaVersion(schema, ec));
    EXPECT_EQ(schema, "1.5");
}

TEST_F(MigrationScenarioTest, MalformedMarkerIgnored) {
    writeText(config_.schemaVersionFile, R"({"schema_version": "v1.x"})");
    markData("latest");
    MigrationManager m = builtin();
    std::string schema;
    std::error_code ec;
    ASSERT_TRUE(m.getSchemaVersion(schema, ec));
    EXPECT_EQ(schema, "0.0");
    EXPECT_EQ(dataVersion(m), "1.0");
}

TEST_F(MigrationScenarioTest, NeedsMigrationComparesNumerically) {
    declareSchema("1.10");
    markData("1.9");
    MigrationManager m = builtin();
    std::error_code ec;
    EXPECT_TRUE(m.needsMigration(ec));

    markData("1.10.0");
    EXPECT_FALSE(m.needsMigration(ec));
}

TEST_F(MigrationScenarioTest, SetDataVersionWritesMarker) {
    MigrationManager m = builtin();
    std::error_code ec;
    ASSERT_TRUE(m.setDataVersion("1.4", "manual", ec));

    Json::Value marker;
    ASSERT_TRUE(util::readJsonFile(dataFile("data_version.json"), marker, ec));
    EXPECT_EQ(marker["version"].asString(), "1.4");
    EXPECT_EQ(marker["description"].asString(), "manual");
    EXPECT_TRUE(marker["migrated_at"].isString());
}

// =============================================================================
// Path resolution
// =============================================================================

TEST_F(MigrationScenarioTest, BuiltinMigrationsRegistered) {
    MigrationManager m = builtin();
    auto keys = m.migrationKeys();
    EXPECT_EQ(keys, (std::vector<std::string>{"1.2->1.3", "1.3->1.4", "1.4->1.5", "1.5->1.6"}));

    EXPECT_EQ(m.getMigrationPath("1.3", "1.4"), std::vector<std::string>{"1.3->1.4"});
    // 다단계 경로는 찾지 않는다.
    EXPECT_TRUE(m.getMigrationPath("1.2", "1.4").empty());
}

TEST_F(MigrationScenarioTest, NoPathFails) {
    declareSchema("1.4");
    markData("1.0");
    MigrationManager m = builtin();
    std::error_code ec;
    EXPECT_FALSE(m.runMigrations(ec));
    EXPECT_EQ(ec, StoreErrc::NoMigrationPath);
    EXPECT_EQ(dataVersion(m), "1.0");
    EXPECT_TRUE(backups().empty());
}

// =============================================================================
// Built-in steps
// =============================================================================

TEST_F(MigrationScenarioTest, AddsEspressoCollections) {
    declareSchema("1.4");
    markData("1.3");
    save("brewers", R"([{"id": 1, "name": "Decent DE1"}])");

    MigrationManager m = builtin();
    std::error_code ec;
    ASSERT_TRUE(m.runMigrations(ec)) << ec.message();

    for (const char* entity : {"shots", "shot_sessions", "portafilters", "baskets", "tampers", "wdt_tools",
                               "leveling_tools"}) {
        Json::Value v = load(entity);
        EXPECT_TRUE(v.isArray() && v.empty()) << entity;
    }
    // 이미 있던 컬렉션은 건드리지 않는다.
    EXPECT_EQ(load("brewers").size(), 1u);
    EXPECT_EQ(dataVersion(m), "1.4");
    EXPECT_TRUE(backups().empty());
}

TEST_F(MigrationScenarioTest, SecondRunIsNoOp) {
    declareSchema("1.4");
    markData("1.3");
    MigrationManager m = builtin();
    std::error_code ec;
    ASSERT_TRUE(m.runMigrations(ec));
    const std::string marker = readText(dataFile("data_version.json"));

    ASSERT_TRUE(m.runMigrations(ec));
    EXPECT_FALSE(ec);
    EXPECT_EQ(readText(dataFile("data_version.json")), marker);
}

TEST_F(MigrationScenarioTest, ExtractsRegionsWithBackup) {
    declareSchema("1.3");
    markData("1.2");
    save("products", R"([
  {"id": 1, "product_name": "Sidamo A", "region": "Sidamo", "country_id": 2, "roaster": "X", "bean_type_id": 4},
  {"id": 2, "product_name": "Sidamo B", "region": "Sidamo", "country_id": 2},
  {"id": 3, "product_name": "Huila", "region": "Huila", "country_id": 5, "region_id": null},
  {"id": 4, "product_name": "Blend", "region": "", "country": "Mixed"}
])");

    MigrationManager m = builtin();
    std::error_code ec;
    ASSERT_TRUE(m.runMigrations(ec)) << ec.message();

    Json::Value regions = load("regions");
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0]["name"].asString(), "Huila");
    EXPECT_EQ(regions[0]["country_id"].asInt(), 5);
    EXPECT_EQ(regions[1]["name"].asString(), "Sidamo");
    EXPECT_EQ(regions[1]["country_id"].asInt(), 2);

    Json::Value products = load("products");
    ASSERT_EQ(products.size(), 4u);
    EXPECT_EQ(products[0]["region_id"][0].asInt(), 2);
    EXPECT_EQ(products[0]["bean_type_id"][0].asInt(), 4);
    EXPECT_EQ(products[1]["region_id"][0].asInt(), 2);
    EXPECT_EQ(products[2]["region_id"][0].asInt(), 1);
    EXPECT_TRUE(products[3]["region_id"].isArray());
    EXPECT_TRUE(products[3]["region_id"].empty());
    for (const auto& p : products) {
        EXPECT_FALSE(p.isMember("region"));
        EXPECT_FALSE(p.isMember("roaster"));
        EXPECT_FALSE(p.isMember("country"));
    }

    auto dirs = backups();
    ASSERT_EQ(dirs.size(), 1u);
    const std::string saved = readText((fs::path(dirs[0]) / "products.json").string());
    EXPECT_NE(saved.find("\"region\": \"Sidamo\""), std::string::npos);
    EXPECT_EQ(dataVersion(m), "1.3");
}

TEST_F(MigrationScenarioTest, ExtractRegionsRerunOnlyCleansProducts) {
    save("regions", R"([{"id": 1, "name": "Huila", "country_id": 5}])");
    save("products", R"([{"id": 1, "product_name": "Huila", "region_id": 1, "roaster": "X"}])");

    MigrationContext ctx(config_.dataDir, config_.lockDir, config_.writeLockTimeout);
    std::error_code ec;
    ASSERT_TRUE(migrateExtractRegions(ctx, ec)) << ec.message();

    EXPECT_EQ(load("regions").size(), 1u);
    Json::Value products = load("products");
    EXPECT_FALSE(products[0].isMember("roaster"));
    ASSERT_TRUE(products[0]["region_id"].isArray());
    EXPECT_EQ(products[0]["region_id"][0].asInt(), 1);

    // 정리된 상태에서 다시 실행해도 그대로다.
    const std::string before = readText(dataFile("products.json"));
    ASSERT_TRUE(migrateExtractRegions(ctx, ec));
    EXPECT_EQ(readText(dataFile("products.json")), before);
}

TEST_F(MigrationScenarioTest, BeanProcessBecomesArray) {
    declareSchema("1.6");
    markData("1.5");
    save("products", R"([
  {"id": 1, "product_name": "a", "bean_process": "Washed"},
  {"id": 2, "product_name": "b", "bean_process": "Natural/Anaerobic"},
  {"id": 3, "product_name": "c", "bean_process": ["Honey"]},
  {"id": 4, "product_name": "d", "bean_process": "Mystery"},
  {"id": 5, "product_name": "e", "bean_process": null},
  {"id": 6, "product_name": "f"}
])");

    MigrationManager m = builtin();
    std::error_code ec;
    ASSERT_TRUE(m.runMigrations(ec)) << ec.message();

    Json::Value products = load("products");
    EXPECT_EQ(products[0]["bean_process"], mapBeanProcess(Json::Value("Washed")));
    ASSERT_EQ(products[1]["bean_process"].size(), 2u);
    EXPECT_EQ(products[1]["bean_process"][0].asString(), "Natural (dry)");
    EXPECT_EQ(products[1]["bean_process"][1].asString(), "Anaerobic");
    EXPECT_EQ(products[2]["bean_process"][0].asString(), "Honey");
    EXPECT_EQ(products[3]["bean_process"][0].asString(), "Other");
    EXPECT_TRUE(products[4]["bean_process"].isArray());
    EXPECT_TRUE(products[4]["bean_process"].empty());
    EXPECT_FALSE(products[5].isMember("bean_process"));

    EXPECT_EQ(backups().size(), 1u);
}

TEST(BeanProcessMappingTest, KnownAndUnknownValues) {
    auto one = [](const char* in) {
        Json::Value out = mapBeanProcess(Json::Value(in));
        return out.size() == 1 ? out[0u].asString() : std::string("<") + std::to_string(out.size()) + ">";
    };
    EXPECT_EQ(one("Washed"), "Washed (wet)");
    EXPECT_EQ(one("Vasket"), "Washed (wet)");
    EXPECT_EQ(one("Sun dried"), "Natural (dry)");
    EXPECT_EQ(one("Dried with and without fruit"), "Other");
    EXPECT_EQ(one("Washed, Natural"), "<2>");
    EXPECT_EQ(one("  "), "<0>");
    EXPECT_EQ(one("washed"), "Other");

    EXPECT_EQ(mapBeanProcess(Json::Value(7))[0u].asString(), "Other");
    Json::Value arr(Json::arrayValue);
    arr.append("Honey");
    EXPECT_EQ(mapBeanProcess(arr), arr);
}

// =============================================================================
// Failure handling
// =============================================================================

TEST_F(MigrationScenarioTest, FailedStepKeepsMarker) {
    declareSchema("2.1");
    markData("2.0");
    MigrationManager m(config_.dataDir, config_);
    m.registerMigration({"2.0", "2.1", "always fails", false, [](const MigrationContext&, std::error_code& ec) {
                             ec = std::make_error_code(std::errc::io_error);
                             return false;
                         }});

    std::error_code ec;
    EXPECT_FALSE(m.runMigrations(ec));
    EXPECT_EQ(ec, StoreErrc::MigrationFailed);
    EXPECT_EQ(dataVersion(m), "2.0");
}

TEST_F(MigrationScenarioTest, ThrowingStepBecomesMigrationFailed) {
    declareSchema("2.1");
    markData("2.0");
    MigrationManager m(config_.dataDir, config_);
    m.registerMigration({"2.0", "2.1", "throws", true, [](const MigrationContext&, std::error_code&) -> bool {
                             throw std::runtime_error("boom");
                         }});

    std::error_code ec;
    EXPECT_FALSE(m.runMigrations(ec));
    EXPECT_EQ(ec, StoreErrc::MigrationFailed);
    EXPECT_EQ(dataVersion(m), "2.0");
    // 백업은 실행 전에 만들어지므로 실패 후에도 남는다.
    EXPECT_EQ(backups().size(), 1u);
}

TEST_F(MigrationScenarioTest, CustomStepSeesContext) {
    declareSchema("3.0");
    markData("2.9");
    MigrationManager m(config_.dataDir, config_);
    m.registerMigration({"2.9", "3.0", "seed", false, [](const MigrationContext& ctx, std::error_code& ec) {
                             Json::Value records(Json::arrayValue);
                             Json::Value r(Json::objectValue);
                             r["id"] = 1;
                             r["name"] = "seeded";
                             records.append(r);
                             return ctx.store("scales", records, ec);
                         }});

    std::error_code ec;
    ASSERT_TRUE(m.runMigrations(ec)) << ec.message();
    EXPECT_EQ(load("scales")[0]["name"].asString(), "seeded");
    EXPECT_EQ(dataVersion(m), "3.0");
}

TEST_F(MigrationScenarioTest, BackupSkipsEarlierBackups) {
    save("products", "[]");
    MigrationManager m = builtin();
    std::error_code ec;

    auto first = m.backupData(ec);
    ASSERT_TRUE(first) << ec.message();
    auto second = m.backupData(ec);
    ASSERT_TRUE(second) << ec.message();
    EXPECT_NE(*first, *second);

    EXPECT_TRUE(fs::exists(fs::path(*second) / "products.json"));
    for (const auto& e : fs::directory_iterator(*second))
        EXPECT_NE(e.path().filename().string().rfind("backup_", 0), 0u) << e.path().string();
}
