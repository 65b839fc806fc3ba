/**
 * @file tests/scenario/RepositoryScenarioTest.cpp
 * @brief 일반 컬렉션 저장소의 사용 시나리오 검증.
 * @details
 * - 생성/조회/수정/삭제 흐름과 감사 필드(id, created_at, updated_at) 관리 규칙을 확인합니다.
 * - 스키마 밖 필드 제거, 검증 실패 시 파일 무변경을 확인합니다.
 */

#include <gtest/gtest.h>

#include <docstore/record/LookupItem.hpp>
#include <docstore/repository/TypedRepository.hpp>
#include <docstore/util/StoreError.hpp>

#include "TestUtil.hpp"

#include <thread>

using namespace DocStore;
using DocStoreTest::readText;
using DocStoreTest::writeText;

class RepositoryScenarioTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_ = dir_.config();
        schemas_ = std::make_shared<const SchemaRegistry>(SchemaRegistry::withBuiltinSchemas());
        products_ = std::make_shared<JsonFileRepository>("products", config_.dataDir, schemas_, config_);
    }

    static Json::Value product(const char* name) {
        Json::Value p(Json::objectValue);
        p["product_name"] = name;
        return p;
    }

    DocStoreTest::ScratchDir dir_{"repo_scenario"};
    StoreConfig config_;
    std::shared_ptr<const SchemaRegistry> schemas_;
    std::shared_ptr<JsonFileRepository> products_;
};

// 시나리오: 생성 -> 조회 -> 수정 -> 삭제 전체 흐름
TEST_F(RepositoryScenarioTest, CrudLifecycle) {
    std::error_code ec;

    Json::Value input = product("Kenya Kiambu");
    input["roast_type"] = 3;
    auto created = products_->create(input, ec);
    ASSERT_TRUE(created) << ec.message();
    EXPECT_EQ((*created)["id"].asInt64(), 1);
    EXPECT_TRUE((*created)["created_at"].isString());
    EXPECT_EQ((*created)["created_at"], (*created)["updated_at"]);

    auto second = products_->create(product("Ethiopia Guji"), ec);
    ASSERT_TRUE(second);
    EXPECT_EQ((*second)["id"].asInt64(), 2);

    auto found = products_->findById(1, ec);
    ASSERT_TRUE(found);
    EXPECT_EQ((*found)["product_name"].asString(), "Kenya Kiambu");
    EXPECT_EQ(products_->count(ec), 2u);
    EXPECT_TRUE(products_->existsById(2, ec));
    EXPECT_FALSE(products_->existsById(3, ec));

    // updated_at은 마이크로초 단위라서 잠깐 기다리면 반드시 달라진다.
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    Json::Value patch(Json::objectValue);
    patch["rating"] = 4.5;
    auto updated = products_->update(1, patch, ec);
    ASSERT_TRUE(updated) << ec.message();
    EXPECT_EQ((*updated)["product_name"].asString(), "Kenya Kiambu");
    EXPECT_EQ((*updated)["roast_type"].asInt(), 3);
    EXPECT_DOUBLE_EQ((*updated)["rating"].asDouble(), 4.5);
    EXPECT_EQ((*updated)["created_at"], (*created)["created_at"]);
    EXPECT_NE((*updated)["updated_at"], (*created)["updated_at"]);

    EXPECT_TRUE(products_->deleteById(1, ec));
    EXPECT_FALSE(products_->findById(1, ec));
    EXPECT_EQ(products_->count(ec), 1u);
}

TEST_F(RepositoryScenarioTest, CallerCannotChooseIdOrTimestamps) {
    std::error_code ec;
    Json::Value input = product("Colombia");
    input["id"] = 99;
    input["created_at"] = "1999-01-01T00:00:00+00:00";
    auto created = products_->create(input, ec);
    ASSERT_TRUE(created);
    EXPECT_EQ((*created)["id"].asInt64(), 1);
    EXPECT_NE((*created)["created_at"].asString(), "1999-01-01T00:00:00+00:00");

    Json::Value patch(Json::objectValue);
    patch["id"] = 42;
    patch["created_at"] = "2000-01-01T00:00:00+00:00";
    auto updated = products_->update(1, patch, ec);
    ASSERT_TRUE(updated);
    EXPECT_EQ((*updated)["id"].asInt64(), 1);
    EXPECT_EQ((*updated)["created_at"], (*created)["created_at"]);
}

TEST_F(RepositoryScenarioTest, UnknownFieldsStripped) {
    std::error_code ec;
    Json::Value input = product("Brazil");
    input["roaster"] = Json::Value(Json::objectValue);
    input["roaster"]["name"] = "joined";
    input["brew_ratio"] = "1:16";
    auto created = products_->create(input, ec);
    ASSERT_TRUE(created);
    EXPECT_FALSE(created->isMember("roaster"));
    EXPECT_FALSE(created->isMember("brew_ratio"));

    const std::string onDisk = readText(products_->path());
    EXPECT_EQ(onDisk.find("brew_ratio"), std::string::npos);
}

TEST_F(RepositoryScenarioTest, ValidationFailureLeavesFileUntouched) {
    std::error_code ec;
    ASSERT_TRUE(products_->create(product("Rwanda"), ec));
    const std::string before = readText(products_->path());

    Json::Value bad = product("Burundi");
    bad["rating"] = 4.3;
    std::vector<FieldViolation> violations;
    EXPECT_FALSE(products_->create(bad, &violations, ec));
    EXPECT_EQ(ec, StoreErrc::ValidationFailed);
    ASSERT_FALSE(violations.empty());
    EXPECT_EQ(violations[0].field, "rating");

    Json::Value missing(Json::objectValue);
    missing["roast_type"] = 2;
    violations.clear();
    EXPECT_FALSE(products_->create(missing, &violations, ec));
    EXPECT_EQ(ec, StoreErrc::ValidationFailed);

    Json::Value patch(Json::objectValue);
    patch["roast_type"] = 11;
    EXPECT_FALSE(products_->update(1, patch, ec));
    EXPECT_EQ(ec, StoreErrc::ValidationFailed);

    EXPECT_EQ(readText(products_->path()), before);
}

TEST_F(RepositoryScenarioTest, NonObjectInputRejected) {
    std::error_code ec;
    std::vector<FieldViolation> violations;
    EXPECT_FALSE(products_->create(Json::Value("text"), &violations, ec));
    EXPECT_EQ(ec, StoreErrc::ValidationFailed);
    EXPECT_EQ(violations.size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(products_->path()));
}

TEST_F(RepositoryScenarioTest, MissingIdIsNotAnError) {
    std::error_code ec;
    ASSERT_TRUE(products_->create(product("Peru"), ec));

    EXPECT_FALSE(products_->update(77, product("x"), ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(products_->deleteById(77, ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(products_->findById(77, ec));
    EXPECT_FALSE(ec);
}

// 다음 id는 현재 남아 있는 최대 id + 1 이다.
TEST_F(RepositoryScenarioTest, IdsFollowCurrentMaximum) {
    std::error_code ec;
    for (const char* n : {"a", "b", "c"})
        ASSERT_TRUE(products_->create(product(n), ec));

    ASSERT_TRUE(products_->deleteById(2, ec));
    auto next = products_->create(product("d"), ec);
    ASSERT_TRUE(next);
    EXPECT_EQ((*next)["id"].asInt64(), 4);

    ASSERT_TRUE(products_->deleteById(4, ec));
    next = products_->create(product("e"), ec);
    ASSERT_TRUE(next);
    EXPECT_EQ((*next)["id"].asInt64(), 4);
}

// 최대 id 가 이미 Int64 끝값이면 다음 id 를 만들 수 없다.
TEST_F(RepositoryScenarioTest, ExhaustedIdSpaceRejected) {
    writeText(products_->path(), R"([{"id": 9223372036854775807, "product_name": "Last"}])");
    const std::string before = readText(products_->path());

    std::error_code ec;
    EXPECT_FALSE(products_->create(product("One more"), ec));
    EXPECT_EQ(ec, StoreErrc::CorruptCollection);
    EXPECT_EQ(readText(products_->path()), before);

    auto last = products_->findById(9223372036854775807LL, ec);
    ASSERT_TRUE(last);
    EXPECT_EQ((*last)["product_name"].asString(), "Last");
}

TEST_F(RepositoryScenarioTest, IdsBeyondInt64AreIgnored) {
    writeText(products_->path(), R"([{"id": 18446744073709551615, "product_name": "Huge"}])");

    std::error_code ec;
    auto next = products_->create(product("Normal"), ec);
    ASSERT_TRUE(next) << ec.message();
    EXPECT_EQ((*next)["id"].asInt64(), 1);
}

TEST_F(RepositoryScenarioTest, FindAndRemoveWhere) {
    std::error_code ec;
    for (int i = 0; i < 5; ++i) {
        Json::Value p = product(("p" + std::to_string(i)).c_str());
        p["roaster_id"] = i % 2 == 0 ? 1 : 2;
        ASSERT_TRUE(products_->create(p, ec));
    }

    EXPECT_EQ(products_->findWhere("roaster_id", Json::Value(1), ec).size(), 3u);
    EXPECT_EQ(products_->findWhere("roaster_id", Json::Value(9), ec).size(), 0u);

    EXPECT_EQ(products_->removeWhere("roaster_id", Json::Value(2), ec), 2u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(products_->count(ec), 3u);
    EXPECT_EQ(products_->removeWhere("roaster_id", Json::Value(2), ec), 0u);
    EXPECT_FALSE(ec);
}

TEST_F(RepositoryScenarioTest, PrettyPrintedUtf8OnDisk) {
    std::error_code ec;
    ASSERT_TRUE(products_->create(product("Café Señor ☕"), ec));

    const std::string onDisk = readText(products_->path());
    EXPECT_NE(onDisk.find("Café Señor ☕"), std::string::npos);
    EXPECT_NE(onDisk.find('\n'), std::string::npos);

    JsonFileRepository reopened("products", config_.dataDir, schemas_, config_);
    auto found = reopened.findById(1, ec);
    ASSERT_TRUE(found);
    EXPECT_EQ((*found)["product_name"].asString(), "Café Señor ☕");
}

TEST_F(RepositoryScenarioTest, UnmodeledEntityPassesThrough) {
    JsonFileRepository notes("field_notes", config_.dataDir, schemas_, config_);
    std::error_code ec;
    Json::Value n(Json::objectValue);
    n["anything"] = "goes";
    n["nested"]["deep"] = 1;
    auto created = notes.create(n, ec);
    ASSERT_TRUE(created);
    EXPECT_EQ((*created)["anything"].asString(), "goes");
    EXPECT_EQ((*created)["nested"]["deep"].asInt(), 1);
}

TEST_F(RepositoryScenarioTest, TypedRepositoryRoundTrip) {
    auto raw = std::make_shared<JsonFileRepository>("kettles", config_.dataDir, schemas_, config_);
    TypedRepository<LookupItem> kettles(raw, LookupItem("kettles"));
    std::error_code ec;

    LookupItem stagg("kettles", "Fellow Stagg EKG");
    stagg.shortForm = "EKG";
    stagg.extra["brand"] = "Fellow";
    stagg.extra["smart_home"] = true;
    auto stored = kettles.create(stagg, ec);
    ASSERT_TRUE(stored) << ec.message();
    EXPECT_EQ(stored->id(), 1);
    EXPECT_EQ(stored->shortForm.value_or(""), "EKG");
    EXPECT_EQ(stored->extra["brand"].asString(), "Fellow");
    EXPECT_FALSE(stored->extra.isMember("smart_home"));
    EXPECT_FALSE(stored->createdAt.empty());

    stored->description = "gooseneck";
    auto updated = kettles.update(*stored, ec);
    ASSERT_TRUE(updated) << ec.message();
    EXPECT_EQ(updated->description.value_or(""), "gooseneck");

    auto all = kettles.findAll(ec);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0]->name, "Fellow Stagg EKG");

    EXPECT_TRUE(kettles.deleteById(1, ec));
    EXPECT_FALSE(kettles.findById(1, ec));
}
