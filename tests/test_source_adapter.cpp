/**
 * @file test_source_adapter.cpp
 * @brief Unit tests for SourceAdapter and the stream sources
 */

#include <gtest/gtest.h>
#include "shopstream/core/errors.h"
#include "shopstream/io/source_adapter.h"
#include <filesystem>
#include <fstream>

using namespace shopstream;
using namespace shopstream::io;

namespace {

std::string viewJson(const std::string& product_id, int64_t time) {
    return R"({"product_id":")" + product_id + R"(","user_id":"U1","view_time":)" +
           std::to_string(time) + R"(,"page_url":"/p","ip":"10.0.0.1","event_time":)" +
           std::to_string(time) + "}";
}

} // anonymous namespace

class SourceAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.allowed_lateness_ms = 10;
        config.poll_batch_size = 100;
        config.retry_attempts = 3;
        config.retry_backoff_ms = 1;
    }

    std::unique_ptr<SourceAdapter> makeAdapter(int32_t partitions = 1,
                                               StreamKind kind = StreamKind::Views) {
        auto source = std::make_unique<InMemoryStreamSource>(partitions);
        log = source.get();
        return std::make_unique<SourceAdapter>(kind, std::move(source), config, &shutdown);
    }

    SourceConfig config;
    ShutdownSignal shutdown;
    InMemoryStreamSource* log = nullptr;
};

TEST_F(SourceAdapterTest, InMemorySourceReadsInOrderPerPartition) {
    InMemoryStreamSource source(2);
    EXPECT_EQ(source.append(0, "a"), 0);
    EXPECT_EQ(source.append(0, "b"), 1);
    EXPECT_EQ(source.append(1, "c"), 0);

    auto messages = source.fetch(1);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].payload, "a");
    EXPECT_EQ(messages[1].payload, "c");

    messages = source.fetch(10);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].payload, "b");
    EXPECT_EQ(messages[0].offset, 1);

    source.seek(0, 0);
    EXPECT_EQ(source.fetch(10).size(), 2u);

    EXPECT_FALSE(source.exhausted());
    source.close();
    EXPECT_TRUE(source.exhausted());
    EXPECT_THROW(source.append(5, "x"), std::out_of_range);
}

TEST_F(SourceAdapterTest, DecodesAndDerivesWatermark) {
    auto adapter = makeAdapter();
    log->append(viewJson("P1", 1000));
    log->append(viewJson("P2", 1050));
    log->append(viewJson("P3", 1020));

    auto batch = adapter->poll();
    EXPECT_TRUE(batch.available);
    ASSERT_EQ(batch.events.size(), 3u);
    EXPECT_EQ(batch.kind, StreamKind::Views);
    EXPECT_EQ(batch.events[1].event_time, 1050);
    EXPECT_EQ(batch.events[2].offset, 2);
    EXPECT_EQ(std::get<ViewEvent>(batch.events[0].record).product_id, "P1");
    EXPECT_EQ(batch.watermark, 1040);
    EXPECT_EQ(batch.offsets.at(0), 3);

    // Out-of-order data never pulls the watermark back
    log->append(viewJson("P4", 900));
    batch = adapter->poll();
    EXPECT_EQ(batch.watermark, 1040);
    EXPECT_EQ(adapter->currentWatermark(), 1040);
}

TEST_F(SourceAdapterTest, EmptyPollKeepsWatermark) {
    auto adapter = makeAdapter();
    auto batch = adapter->poll();
    EXPECT_TRUE(batch.events.empty());
    EXPECT_EQ(batch.watermark, NO_WATERMARK);
    EXPECT_EQ(batch.offsets.at(0), 0);
}

TEST_F(SourceAdapterTest, UnboundedSourceHasNoWatermark) {
    config.allowed_lateness_ms = UNBOUNDED;
    auto adapter = makeAdapter(1, StreamKind::Products);
    log->append(R"({"id":"P1","name":"Anvil","brand":"Acme","event_time":1000})");

    auto batch = adapter->poll();
    ASSERT_EQ(batch.events.size(), 1u);
    EXPECT_EQ(std::get<ProductRecord>(batch.events[0].record).name, "Anvil");
    EXPECT_EQ(batch.watermark, NO_WATERMARK);
}

TEST_F(SourceAdapterTest, MalformedRecordsSkipped) {
    auto adapter = makeAdapter();
    log->append(viewJson("P1", 1000));
    log->append("{not json");
    log->append(R"({"product_id":"P2"})");
    log->append(viewJson("P3", 1010));

    auto batch = adapter->poll();
    ASSERT_EQ(batch.events.size(), 2u);
    EXPECT_EQ(batch.malformed, 2u);
    EXPECT_EQ(batch.events[1].offset, 3);
    EXPECT_EQ(batch.offsets.at(0), 4);

    auto stats = adapter->getStats();
    EXPECT_EQ(stats["records_read"], 2);
    EXPECT_EQ(stats["malformed_records"], 2);
}

TEST_F(SourceAdapterTest, TransientFailuresRetried) {
    auto adapter = makeAdapter();
    log->append(viewJson("P1", 1000));
    log->failNextFetches(2);

    auto batch = adapter->poll();
    EXPECT_TRUE(batch.available);
    EXPECT_EQ(batch.events.size(), 1u);
    EXPECT_EQ(log->fetchCount(), 3);
    EXPECT_EQ(adapter->getStats()["read_retries"], 2);
}

TEST_F(SourceAdapterTest, UnavailableAfterRetriesReportedInBatch) {
    auto adapter = makeAdapter();
    log->append(viewJson("P1", 1000));
    adapter->poll();
    log->append(viewJson("P2", 2000));
    log->setUnavailable(true);

    auto batch = adapter->poll();
    EXPECT_FALSE(batch.available);
    EXPECT_FALSE(batch.error.empty());
    EXPECT_TRUE(batch.events.empty());
    EXPECT_EQ(batch.watermark, 990);
    EXPECT_EQ(batch.offsets.at(0), 1);
    EXPECT_EQ(adapter->getStats()["failed_polls"], 1);

    // Recovers without losing the record
    log->setUnavailable(false);
    batch = adapter->poll();
    EXPECT_TRUE(batch.available);
    ASSERT_EQ(batch.events.size(), 1u);
    EXPECT_EQ(batch.events[0].event_time, 2000);
}

TEST_F(SourceAdapterTest, ShutdownInterruptsBackoff) {
    config.retry_attempts = 10;
    config.retry_backoff_ms = 10000;
    auto adapter = makeAdapter();
    log->setUnavailable(true);
    shutdown.request();

    auto start = std::chrono::steady_clock::now();
    auto batch = adapter->poll();
    EXPECT_FALSE(batch.available);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(log->fetchCount(), 1);
}

TEST_F(SourceAdapterTest, SeekResumesFromOffsetsAndWatermark) {
    auto adapter = makeAdapter(2);
    for (int i = 0; i < 5; ++i) {
        log->append(0, viewJson("P1", 1000 + i));
        log->append(1, viewJson("P2", 2000 + i));
    }

    adapter->seek({{0, 3}}, 1500);
    auto offsets = adapter->offsets();
    EXPECT_EQ(offsets.at(0), 3);
    EXPECT_EQ(offsets.at(1), 0);
    EXPECT_EQ(adapter->currentWatermark(), 1500);

    auto batch = adapter->poll();
    ASSERT_EQ(batch.events.size(), 7u);
    EXPECT_EQ(batch.watermark, 2004 - 10);

    adapter->seekToEarliest();
    EXPECT_EQ(adapter->currentWatermark(), NO_WATERMARK);
    EXPECT_EQ(adapter->poll().events.size(), 10u);
}

TEST_F(SourceAdapterTest, ConstructorValidatesConfig) {
    config.poll_batch_size = 0;
    EXPECT_THROW(makeAdapter(), std::invalid_argument);
    config.poll_batch_size = 1;
    config.retry_attempts = 0;
    EXPECT_THROW(makeAdapter(), std::invalid_argument);
    EXPECT_THROW(SourceAdapter bad(StreamKind::Views, nullptr, SourceConfig()),
                 std::invalid_argument);
}

// ========== NdjsonFileSource ==========

class NdjsonFileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              (std::string("shopstream_source_test_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::string write(const std::string& name, const std::string& content,
                      bool append = false) {
        auto path = (dir / name).string();
        std::ofstream out(path, append ? std::ios::app : std::ios::trunc);
        out << content;
        return path;
    }

    std::filesystem::path dir;
};

TEST_F(NdjsonFileSourceTest, ReadsLinesWithLineOffsets) {
    auto path = write("views.ndjson", "{\"a\":1}\n\n{\"a\":2}\r\n{\"a\":3}");
    NdjsonFileSource source({path});

    auto messages = source.fetch(10);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].offset, 0);
    EXPECT_EQ(messages[1].offset, 2);  // blank line 1 keeps its offset
    EXPECT_EQ(messages[1].payload, "{\"a\":2}");
    EXPECT_EQ(messages[2].offset, 3);
    EXPECT_EQ(messages[2].payload, "{\"a\":3}");
    EXPECT_TRUE(source.exhausted());
    EXPECT_TRUE(source.fetch(10).empty());
}

TEST_F(NdjsonFileSourceTest, BatchLimitAndSeek) {
    auto path = write("sales.ndjson", "l0\nl1\nl2\nl3\n");
    NdjsonFileSource source({path});

    auto messages = source.fetch(2);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_FALSE(source.exhausted());

    source.seek(0, 3);
    messages = source.fetch(10);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].payload, "l3");
    EXPECT_EQ(messages[0].offset, 3);

    // Seeking past the end resumes at the end
    source.seek(0, 100);
    EXPECT_TRUE(source.fetch(10).empty());
}

TEST_F(NdjsonFileSourceTest, FollowWaitsForCompleteLines) {
    auto path = write("views.ndjson", "first\nsec");
    NdjsonFileSource source({path}, true);

    auto messages = source.fetch(10);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].payload, "first");
    EXPECT_FALSE(source.exhausted());

    write("views.ndjson", "ond\nthird\n", true);
    messages = source.fetch(10);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].payload, "second");
    EXPECT_EQ(messages[0].offset, 1);
    EXPECT_EQ(messages[1].payload, "third");
}

TEST_F(NdjsonFileSourceTest, PartitionPerFile) {
    auto p0 = write("p0.ndjson", "a\n");
    auto p1 = write("p1.ndjson", "b\nc\n");
    NdjsonFileSource source({p0, p1});

    EXPECT_EQ(source.partitions(), (std::vector<int32_t>{0, 1}));
    auto messages = source.fetch(10);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[2].partition, 1);
    EXPECT_EQ(messages[2].offset, 1);
}

TEST_F(NdjsonFileSourceTest, MissingFileIsUnavailable) {
    NdjsonFileSource source({(dir / "missing.ndjson").string()});
    EXPECT_THROW(source.fetch(10), SourceUnavailable);
    EXPECT_THROW(NdjsonFileSource bad(std::vector<std::string>{}), std::invalid_argument);
}
