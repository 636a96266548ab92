#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include <vector>
#include "components/sink/audit_log.h"
#include "test_support.h"

using namespace facegate;
using facegate::test::uniqueTempPath;

namespace {

class SqliteAuditLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = uniqueTempPath("facegate_audit");
        dbPath = (dir / "nested" / "audit.db").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    static AuditRecord record(uint64_t sequence, const std::string& identity, double confidence) {
        AuditRecord rec;
        rec.sequence = sequence;
        rec.timestamp = "2024-05-01 12:00:00";
        rec.identity = identity;
        rec.confidence = confidence;
        rec.status = identity == "Unknown" ? "Unknown" : "Recognized";
        rec.actuatorState = identity == "Unknown" ? "OFF" : "ON";
        return rec;
    }

    std::filesystem::path dir;
    std::string dbPath;
};

} // namespace

TEST_F(SqliteAuditLogTest, CreatesDatabaseAndDirectory) {
    SqliteAuditLog log("audit", dbPath);

    ASSERT_TRUE(log.start());
    EXPECT_TRUE(log.isRunning());
    EXPECT_TRUE(std::filesystem::exists(dbPath));

    auto count = log.countRecords();
    ASSERT_TRUE(count.isSuccess());
    EXPECT_EQ(count.getValue(), 0);
}

TEST_F(SqliteAuditLogTest, AppendedRecordsReadBackNewestFirst) {
    SqliteAuditLog log("audit", dbPath);
    ASSERT_TRUE(log.initialize());

    ASSERT_TRUE(log.append(record(1, "Amy", 0.92)).isSuccess());
    ASSERT_TRUE(log.append(record(2, "Unknown", 0.12)).isSuccess());
    ASSERT_TRUE(log.append(record(3, "Bob", 0.75)).isSuccess());

    auto recent = log.recentRecords(2);
    ASSERT_TRUE(recent.isSuccess()) << recent.getError();
    const auto& rows = recent.getValue();
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].sequence, 3u);
    EXPECT_EQ(rows[0].identity, "Bob");
    EXPECT_EQ(rows[0].status, "Recognized");
    EXPECT_EQ(rows[0].actuatorState, "ON");
    EXPECT_DOUBLE_EQ(rows[0].confidence, 0.75);
    EXPECT_EQ(rows[0].timestamp, "2024-05-01 12:00:00");

    EXPECT_EQ(rows[1].identity, "Unknown");
    EXPECT_EQ(rows[1].actuatorState, "OFF");

    EXPECT_EQ(log.countRecords().getValue(), 3);
}

TEST_F(SqliteAuditLogTest, RecordsSurviveReopen) {
    {
        SqliteAuditLog log("audit", dbPath);
        ASSERT_TRUE(log.initialize());
        ASSERT_TRUE(log.append(record(9, "Amy", 0.8)).isSuccess());
    }

    SqliteAuditLog reopened("audit", dbPath);
    ASSERT_TRUE(reopened.initialize());
    EXPECT_EQ(reopened.countRecords().getValue(), 1);
}

TEST_F(SqliteAuditLogTest, AppendBeforeInitializeFails) {
    SqliteAuditLog log("audit", dbPath);

    auto result = log.append(record(1, "Amy", 0.9));

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getErrorKind(), ErrorKind::IoError);
    EXPECT_EQ(log.getStatus()["failed"].get<uint64_t>(), 1u);
}

TEST_F(SqliteAuditLogTest, ConcurrentAppendsAreSerialized) {
    SqliteAuditLog log("audit", dbPath);
    ASSERT_TRUE(log.initialize());

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&log, w] {
            for (int i = 0; i < 25; ++i) {
                EXPECT_TRUE(log.append(record(w * 100 + i, "Amy", 0.9)).isSuccess());
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(log.countRecords().getValue(), 100);
    EXPECT_EQ(log.getStatus()["appended"].get<uint64_t>(), 100u);
}

TEST(AuditRecordTest, JsonUsesColumnNames) {
    AuditRecord rec;
    rec.sequence = 4;
    rec.identity = "Amy";
    rec.status = "Recognized";
    rec.actuatorState = "ON";

    auto json = rec.toJson();
    EXPECT_EQ(json["sequence"].get<uint64_t>(), 4u);
    EXPECT_EQ(json["identity"], "Amy");
    EXPECT_EQ(json["actuator_state"], "ON");
}
