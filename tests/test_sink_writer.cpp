/**
 * @file test_sink_writer.cpp
 * @brief Unit tests for UpsertSinkWriter and the file outputs
 */

#include <gtest/gtest.h>
#include "shopstream/core/errors.h"
#include "shopstream/io/sink_writer.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace shopstream;
using namespace shopstream::io;

class UpsertSinkWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.index = "views";
        config.batch_size = 3;
        config.batch_interval_ms = 20;
        config.max_retry_attempts = 2;
        config.retry_backoff_ms = 1;
        config.output_queue_capacity = 100;
        config.dead_letter_capacity = 10;
    }

    static EnrichedRecord record(const std::string& product_id, int64_t view_time) {
        EnrichedRecord r;
        r.product_id = product_id;
        r.user_id = "U1";
        r.first_name = "Ada";
        r.order_id = 42;
        r.order_date = view_time - 5;
        r.view_time = view_time;
        return r;
    }

    static std::vector<OutputRecord> batchOf(size_t n) {
        std::vector<OutputRecord> batch;
        for (size_t i = 0; i < n; ++i) {
            batch.push_back({i + 1, record("P" + std::to_string(i), 1000)});
        }
        return batch;
    }

    SinkWriterConfig config;
    InMemoryUpsertSink sink;
    InMemoryDeadLetterOutput dead_letter;
};

TEST_F(UpsertSinkWriterTest, WriteBatchUpsertsById) {
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    ASSERT_TRUE(writer.writeBatch(batchOf(3)));

    EXPECT_EQ(sink.documentCount("views"), 3u);
    auto body = sink.document("views", "P1|U1|1000");
    ASSERT_TRUE(body.has_value());
    auto json = nlohmann::json::parse(*body);
    EXPECT_EQ(json["order_id"], 42);
    EXPECT_TRUE(json["last_name"].is_null());
    EXPECT_EQ(writer.deliveredSeq(), 3u);

    // Same ids again overwrite rather than duplicate
    ASSERT_TRUE(writer.writeBatch(batchOf(3)));
    EXPECT_EQ(sink.documentCount("views"), 3u);
    EXPECT_EQ(sink.writeCount("P1|U1|1000"), 2);
}

TEST_F(UpsertSinkWriterTest, TransientFailureRetried) {
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    sink.failNextPuts(2);

    ASSERT_TRUE(writer.writeBatch(batchOf(2)));
    EXPECT_EQ(sink.documentCount("views"), 2u);
    EXPECT_EQ(sink.putCount(), 3);
    EXPECT_EQ(dead_letter.count(), 0u);
    EXPECT_EQ(writer.getStats()["sink_retries"], 2);
}

TEST_F(UpsertSinkWriterTest, OnlyRejectedDocumentsRetried) {
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    sink.rejectDocument("P0|U1|1000", 1);

    ASSERT_TRUE(writer.writeBatch(batchOf(3)));
    EXPECT_EQ(sink.documentCount("views"), 3u);
    EXPECT_EQ(sink.writeCount("P0|U1|1000"), 1);
    EXPECT_EQ(sink.writeCount("P1|U1|1000"), 1);
    EXPECT_EQ(writer.getStats()["documents_written"], 3);
}

TEST_F(UpsertSinkWriterTest, PersistentRejectionDeadLettered) {
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    sink.rejectDocument("P1|U1|1000");

    ASSERT_TRUE(writer.writeBatch(batchOf(3)));
    EXPECT_EQ(sink.documentCount("views"), 2u);
    ASSERT_EQ(dead_letter.count(), 1u);

    auto entry = dead_letter.entries()[0];
    EXPECT_EQ(entry.id, "P1|U1|1000");
    EXPECT_EQ(entry.attempts, 3);
    EXPECT_NE(entry.error.find("rejection"), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(entry.document)["product_id"], "P1");

    // Dead-lettered records count as delivered
    EXPECT_EQ(writer.deliveredSeq(), 3u);
}

TEST_F(UpsertSinkWriterTest, DeadLetterOverflowIsFatal) {
    config.dead_letter_capacity = 1;
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    sink.rejectDocument("P0|U1|1000");
    sink.rejectDocument("P1|U1|1000");

    EXPECT_THROW(writer.writeBatch(batchOf(2)), SinkWriteFailed);
    EXPECT_EQ(dead_letter.count(), 1u);
    EXPECT_EQ(writer.deliveredSeq(), 0u);
}

TEST_F(UpsertSinkWriterTest, AbortStopsRetrying) {
    config.retry_backoff_ms = 10000;
    ShutdownSignal abort;
    abort.request();
    UpsertSinkWriter writer(config, &sink, &dead_letter, &abort);
    sink.failNextPuts(1);

    EXPECT_FALSE(writer.writeBatch(batchOf(1)));
    EXPECT_EQ(dead_letter.count(), 0u);
    EXPECT_EQ(writer.deliveredSeq(), 0u);
}

TEST_F(UpsertSinkWriterTest, BackgroundWriterDeliversEverything) {
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    ASSERT_TRUE(writer.start());
    EXPECT_FALSE(writer.start());

    for (uint64_t seq = 1; seq <= 10; ++seq) {
        ASSERT_TRUE(writer.submit(seq, record("P" + std::to_string(seq), 1000)));
    }
    EXPECT_TRUE(writer.waitDelivered(10, std::chrono::seconds(10)));
    EXPECT_EQ(sink.documentCount("views"), 10u);

    writer.stop();
    EXPECT_FALSE(writer.isRunning());
    EXPECT_FALSE(writer.submit(11, record("P11", 1000)));
}

TEST_F(UpsertSinkWriterTest, PartialBatchFlushedAfterInterval) {
    config.batch_size = 100;
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    writer.start();

    writer.submit(1, record("P1", 1000));
    EXPECT_TRUE(writer.waitDelivered(1, std::chrono::seconds(10)));
    EXPECT_EQ(sink.documentCount("views"), 1u);
    EXPECT_EQ(writer.getStats()["batches_written"], 1);
}

TEST_F(UpsertSinkWriterTest, StopDrainsQueue) {
    config.batch_interval_ms = 60000;
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    writer.start();
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        writer.submit(seq, record("P" + std::to_string(seq), 1000));
    }
    writer.stop();
    EXPECT_EQ(sink.documentCount("views"), 5u);
    EXPECT_EQ(writer.deliveredSeq(), 5u);
}

TEST_F(UpsertSinkWriterTest, FailureSurfacedToWaiters) {
    config.dead_letter_capacity = 0;
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    sink.rejectDocument("P1|U1|1000");
    writer.start();

    writer.submit(1, record("P1", 1000));
    EXPECT_FALSE(writer.waitDelivered(1, std::chrono::seconds(10)));
    EXPECT_TRUE(writer.failed());
    EXPECT_NE(writer.failureReason().find("dead-letter capacity"), std::string::npos);
    EXPECT_FALSE(writer.submit(2, record("P2", 1000)));
}

TEST_F(UpsertSinkWriterTest, ResetDeliveredAfterRestore) {
    UpsertSinkWriter writer(config, &sink, &dead_letter);
    writer.resetDelivered(40);
    EXPECT_TRUE(writer.waitDelivered(40, std::chrono::milliseconds(1)));
    EXPECT_FALSE(writer.waitDelivered(41, std::chrono::milliseconds(1)));
}

TEST_F(UpsertSinkWriterTest, ConstructorValidatesArguments) {
    EXPECT_THROW(UpsertSinkWriter bad(config, nullptr, &dead_letter), std::invalid_argument);
    config.batch_size = 0;
    EXPECT_THROW(UpsertSinkWriter bad(config, &sink, &dead_letter), std::invalid_argument);
}

// ========== File outputs ==========

class FileOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              (std::string("shopstream_sink_test_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    static std::vector<nlohmann::json> readLines(const std::string& path) {
        std::vector<nlohmann::json> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(nlohmann::json::parse(line));
        }
        return lines;
    }

    std::filesystem::path dir;
};

TEST_F(FileOutputTest, NdjsonSinkAppendsUpserts) {
    auto path = (dir / "out.ndjson").string();
    NdjsonFileSink sink(path);

    auto response = sink.put("views", {{"a", R"({"x":1})"}, {"b", "not json"}});
    ASSERT_EQ(response.failures.size(), 1u);
    EXPECT_EQ(response.failures[0].id, "b");
    EXPECT_FALSE(response.ok());

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["index"], "views");
    EXPECT_EQ(lines[0]["id"], "a");
    EXPECT_EQ(lines[0]["document"]["x"], 1);
}

TEST_F(FileOutputTest, NdjsonDeadLetterOutput) {
    auto path = (dir / "dead.ndjson").string();
    NdjsonDeadLetterOutput output(path);
    output.write({"a", "not json", "invalid document", 3});
    EXPECT_EQ(output.count(), 1u);

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["document"], "not json");
    EXPECT_EQ(lines[0]["attempts"], 3);
}
