/**
 * @file tests/integration/ConcurrencyTest.cpp
 * @brief 동시 쓰기 시나리오 검증.
 * @details
 * - 같은 인스턴스를 공유하는 스레드와 같은 파일을 가리키는 별도 인스턴스 모두 파일 잠금으로 직렬화되어야 합니다.
 * - 모든 create가 성공했을 때 id는 1..N 이 정확히 한 번씩 나타나야 합니다 (유실/중복 없음).
 * - 기본값 플래그는 어떤 교차 순서에서도 최대 한 레코드에만 남아야 합니다.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <docstore/repository/LookupRepository.hpp>
#include <docstore/util/StoreError.hpp>

#include "TestUtil.hpp"

using namespace DocStore;

class ConcurrencyTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_ = dir_.config();
        schemas_ = std::make_shared<const SchemaRegistry>(SchemaRegistry::withBuiltinSchemas());
    }

    std::shared_ptr<JsonFileRepository> notes() {
        return std::make_shared<JsonFileRepository>("notes", config_.dataDir, schemas_, config_);
    }

    static Json::Value note(int thread, int i) {
        Json::Value n(Json::objectValue);
        n["thread"] = thread;
        n["seq"] = i;
        return n;
    }

    static void expectIdsOneToN(const std::vector<Json::Value>& all, size_t n) {
        std::set<RecordId> ids;
        for (const auto& r : all)
            ids.insert(JsonFileRepository::recordId(r));
        EXPECT_EQ(all.size(), n);
        EXPECT_EQ(ids.size(), n);
        EXPECT_EQ(*ids.begin(), 1);
        EXPECT_EQ(*ids.rbegin(), static_cast<RecordId>(n));
    }

    DocStoreTest::ScratchDir dir_{"concurrency"};
    StoreConfig config_;
    std::shared_ptr<const SchemaRegistry> schemas_;
};

// 시나리오: 하나의 저장소 인스턴스를 여러 스레드가 공유한다.
TEST_F(ConcurrencyTest, SharedInstanceCreatesAreSerialized) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 10;
    auto repo = notes();

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::error_code ec;
                if (!repo->create(note(t, i), ec))
                    ++failures;
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(failures.load(), 0);
    std::error_code ec;
    expectIdsOneToN(repo->findAll(ec), kThreads * kPerThread);
    EXPECT_FALSE(ec);
}

// 시나리오: 스레드마다 별도 인스턴스(프로세스 간 공유와 같은 조건)를 만든다.
TEST_F(ConcurrencyTest, SeparateInstancesCreatesAreSerialized) {
    constexpr int kThreads = 6;
    constexpr int kPerThread = 10;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            auto repo = notes();
            for (int i = 0; i < kPerThread; ++i) {
                std::error_code ec;
                if (!repo->create(note(t, i), ec))
                    ++failures;
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(failures.load(), 0);
    std::error_code ec;
    expectIdsOneToN(notes()->findAll(ec), kThreads * kPerThread);
}

// 시나리오: 쓰기와 동시에 읽는 쪽은 항상 완전한 컬렉션만 본다.
TEST_F(ConcurrencyTest, ReadersNeverSeePartialFiles) {
    auto writer = notes();
    std::atomic<bool> done{false};
    std::atomic<int> readErrors{0};

    std::thread reader([&] {
        auto repo = notes();
        size_t last = 0;
        while (!done.load()) {
            std::error_code ec;
            auto all = repo->findAll(ec);
            if (ec || all.size() < last)
                ++readErrors;
            last = all.size();
        }
    });

    for (int i = 0; i < 40; ++i) {
        std::error_code ec;
        ASSERT_TRUE(writer->create(note(0, i), ec)) << ec.message();
    }
    done = true;
    reader.join();

    EXPECT_EQ(readErrors.load(), 0);
}

// 시나리오: setDefault 경쟁 후에도 기본값은 정확히 하나다.
TEST_F(ConcurrencyTest, ConcurrentSetDefaultKeepsSingleDefault) {
    auto seed = std::make_shared<LookupRepository>("grinders", config_.dataDir, schemas_, config_);
    std::vector<RecordId> ids;
    for (const char* name : {"C40", "Niche Zero", "EK43", "Kinu M47"}) {
        std::error_code ec;
        auto created = seed->getOrCreate(name, Json::Value(), ec);
        ASSERT_TRUE(created) << ec.message();
        ids.push_back(JsonFileRepository::recordId(*created));
    }

    std::vector<std::thread> threads;
    for (size_t t = 0; t < ids.size(); ++t) {
        threads.emplace_back([&, t] {
            LookupRepository repo("grinders", config_.dataDir, schemas_, config_);
            for (int round = 0; round < 5; ++round) {
                std::error_code ec;
                repo.setDefault(ids[(t + static_cast<size_t>(round)) % ids.size()], ec);
                EXPECT_FALSE(ec) << ec.message();
            }
        });
    }
    for (auto& th : threads)
        th.join();

    std::error_code ec;
    int defaults = 0;
    for (const auto& r : seed->findAll(ec)) {
        if (r["is_default"].asBool())
            ++defaults;
    }
    EXPECT_EQ(defaults, 1);
}

// 시나리오: 다른 인스턴스가 잠금을 쥐고 있으면 쓰기는 LockTimeout 으로 실패하고 파일은 그대로다.
TEST_F(ConcurrencyTest, WriteTimesOutWhileLockHeld) {
    config_.writeLockTimeout = std::chrono::milliseconds(100);
    auto repo = notes();
    std::error_code ec;
    ASSERT_TRUE(repo->create(note(0, 0), ec));

    CollectionFile file(repo->path(), config_.effectiveLockDir());
    auto held = file.lock(std::chrono::milliseconds(100), ec);
    ASSERT_FALSE(ec);

    auto blocked = notes();
    EXPECT_FALSE(blocked->create(note(0, 1), ec));
    EXPECT_EQ(ec, StoreErrc::LockTimeout);

    held.unlockIgnore();
    EXPECT_EQ(notes()->count(ec), 1u);
}
