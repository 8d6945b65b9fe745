/// @file key_store_integration_test.cpp
/// @brief DatabaseKeyRepository over a real SQLite file through ServiceDatabase.

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "eks/foundation/error_code.hpp"
#include "eks/foundation/service_database.hpp"
#include "eks/service/key_repository.hpp"

using namespace eks::foundation;
using namespace eks::service;

class KeyStoreIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("eks_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        config_.path = (dir_ / "keys.sqlite").string();
        config_.maxConnections = 2;

        db_ = std::make_shared<ServiceDatabase>();
        auto connected = db_->connect(config_);
        ASSERT_TRUE(connected.hasValue()) << connected.error().message();

        repo_ = std::make_unique<DatabaseKeyRepository>(db_);
        auto initialized = repo_->initialize();
        ASSERT_TRUE(initialized.hasValue()) << initialized.error().message();
    }

    void TearDown() override {
        repo_.reset();
        if (db_) {
            db_->disconnect();
        }
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    DatabaseConfig config_;
    std::shared_ptr<ServiceDatabase> db_;
    std::unique_ptr<DatabaseKeyRepository> repo_;
};

TEST_F(KeyStoreIntegrationTest, InitializeIsIdempotent) {
    EXPECT_TRUE(repo_->initialize().hasValue());
    EXPECT_EQ(repo_->count().value(), 0u);
}

TEST_F(KeyStoreIntegrationTest, InsertFindCount) {
    Bytes der{0x30, 0x82, 0x01, 0x22, 0x00, 0x27, 0xff};
    auto id = repo_->insert("alice", der);
    ASSERT_TRUE(id.hasValue()) << id.error().message();
    EXPECT_TRUE(id.value().isValid());

    auto found = repo_->find("alice");
    ASSERT_TRUE(found.hasValue()) << found.error().message();
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->id, id.value());
    EXPECT_EQ(found.value()->name, "alice");
    EXPECT_EQ(found.value()->pubkey, der);

    EXPECT_EQ(repo_->count().value(), 1u);
}

TEST_F(KeyStoreIntegrationTest, MissingNameIsEmptySuccess) {
    auto found = repo_->find("nobody");
    ASSERT_TRUE(found.hasValue());
    EXPECT_FALSE(found.value().has_value());
}

TEST_F(KeyStoreIntegrationTest, QuotesInNamesAreStoredVerbatim) {
    ASSERT_TRUE(repo_->insert("o'brien", Bytes{1}).hasValue());
    ASSERT_TRUE(repo_->insert("x'); DROP TABLE keys; --", Bytes{2}).hasValue());

    EXPECT_EQ(repo_->find("o'brien").value()->pubkey, (Bytes{1}));
    EXPECT_EQ(repo_->find("x'); DROP TABLE keys; --").value()->pubkey, (Bytes{2}));
    EXPECT_EQ(repo_->count().value(), 2u);
}

TEST_F(KeyStoreIntegrationTest, DuplicateNameIsTaken) {
    ASSERT_TRUE(repo_->insert("alice", Bytes{1}).hasValue());

    auto again = repo_->insert("alice", Bytes{2});
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::NameTaken);
    EXPECT_EQ(repo_->find("alice").value()->pubkey, (Bytes{1}));
    EXPECT_EQ(repo_->count().value(), 1u);
}

TEST_F(KeyStoreIntegrationTest, UniqueConstraintIsClassified) {
    ASSERT_TRUE(repo_->insert("alice", Bytes{1}).hasValue());

    auto raw = db_->execute("INSERT INTO keys (name, pubkey) VALUES ('alice', X'02')");
    ASSERT_TRUE(raw.hasError());
    EXPECT_EQ(raw.error().code(), ErrorCode::ConstraintViolation);
}

TEST_F(KeyStoreIntegrationTest, RolledBackInsertLeavesNoRow) {
    {
        auto txn = db_->beginTransaction();
        ASSERT_TRUE(txn.hasValue());
        PreparedStatement stmt("INSERT INTO keys (name, pubkey) VALUES ($name, $key)");
        stmt.bindString("name", "ghost").bindBlob("key", Bytes{9});
        ASSERT_TRUE(txn.value().execute(stmt).hasValue());
        ASSERT_TRUE(txn.value().rollback().hasValue());
        EXPECT_FALSE(txn.value().isActive());
    }
    EXPECT_FALSE(repo_->find("ghost").value().has_value());
    EXPECT_EQ(repo_->count().value(), 0u);
}

TEST_F(KeyStoreIntegrationTest, AbandonedTransactionRollsBack) {
    {
        auto txn = db_->beginTransaction();
        ASSERT_TRUE(txn.hasValue());
        ASSERT_TRUE(
            txn.value().execute("INSERT INTO keys (name, pubkey) VALUES ('ghost', X'09')")
                .hasValue());
    }
    EXPECT_FALSE(repo_->find("ghost").value().has_value());
}

TEST_F(KeyStoreIntegrationTest, KeysSurviveReconnect) {
    ASSERT_TRUE(repo_->insert("alice", Bytes{7, 7}).hasValue());
    repo_.reset();
    db_->disconnect();

    auto db = std::make_shared<ServiceDatabase>();
    ASSERT_TRUE(db->connect(config_).hasValue());
    DatabaseKeyRepository reopened(db);
    ASSERT_TRUE(reopened.initialize().hasValue());
    EXPECT_EQ(reopened.find("alice").value()->pubkey, (Bytes{7, 7}));
    db->disconnect();
}

TEST_F(KeyStoreIntegrationTest, ConcurrentInsertsOfOneNameHaveOneWinner) {
    constexpr int kThreads = 4;
    std::vector<int> wins(kThreads, 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, &wins, t] {
            if (repo_->insert("contested", Bytes{static_cast<uint8_t>(t)}).hasValue()) {
                wins[static_cast<std::size_t>(t)] = 1;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    int winners = 0;
    for (int w : wins) {
        winners += w;
    }
    EXPECT_EQ(winners, 1);
    EXPECT_EQ(repo_->count().value(), 1u);
}
