#include <gtest/gtest.h>
#include "chunkvault/pipeline/storage_pipeline.hpp"
#include "chunkvault/utilities/digest.hpp"
#include "chunkvault/utilities/metrics.h"
#include "test_utils.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chunkvault;
using chunkvault_test::patternedBytes;
using chunkvault_test::readFile;
using chunkvault_test::TempDir;
using chunkvault_test::writeFile;

namespace fs = std::filesystem;

class StoragePipelineTest : public ::testing::Test {
protected:
    TempDir dir_{"pipeline"};

    PipelineConfig makeConfig() const {
        PipelineConfig config;
        config.basePath = dir_.file("vault");
        config.storageLocations = {dir_.file("replica_a"), dir_.file("replica_b")};
        config.replicationFactor = 2;
        config.chunkSize = 1024;
        return config;
    }
};

TEST_F(StoragePipelineTest, ConstructorValidatesSettings) {
    PipelineConfig config = makeConfig();
    config.maxCapacityBytes = 0;
    EXPECT_THROW(StoragePipeline{config}, std::invalid_argument);

    config = makeConfig();
    config.chunkSize = 0;
    EXPECT_THROW(StoragePipeline{config}, std::invalid_argument);

    config = makeConfig();
    config.replicationFactor = 0;
    EXPECT_THROW(StoragePipeline{config}, std::invalid_argument);
}

TEST_F(StoragePipelineTest, CreatesLayout) {
    StoragePipeline pipeline(makeConfig());
    EXPECT_TRUE(fs::is_directory(dir_.path() / "vault" / "metadata"));
    EXPECT_TRUE(fs::is_directory(dir_.path() / "vault" / "organized" / "documents"));
    EXPECT_TRUE(fs::is_directory(dir_.path() / "replica_a"));
}

TEST_F(StoragePipelineTest, RunsStagesInOrder) {
    const std::string data = patternedBytes(3000) + std::string(7000, 'a');
    writeFile(dir_.file("input.bin"), data);
    StoragePipeline pipeline(makeConfig());

    PipelineRecord record = pipeline.storeFile(dir_.file("input.bin"));
    ASSERT_TRUE(record.ok()) << record.error;
    ASSERT_EQ(record.steps.size(), 3u);
    EXPECT_EQ(record.steps[0].name, "deduplication");
    EXPECT_EQ(record.steps[1].name, "compression");
    EXPECT_EQ(record.steps[2].name, "replication");
    EXPECT_EQ(record.originalSize, data.size());

    const auto& dedup = std::get<DedupResult>(record.steps[0].result);
    EXPECT_EQ(dedup.totalChunks, 10u);
    EXPECT_TRUE(fs::exists(dir_.path() / "vault" / "deduplicated" / "chunks"));

    const auto& compressed = std::get<CompressionResult>(record.steps[1].result);
    ASSERT_TRUE(compressed.ok()) << compressed.error;
    EXPECT_EQ(fs::path(compressed.outputPath).parent_path().string(),
              (dir_.path() / "vault" / "compressed").string());
    EXPECT_EQ(fs::path(compressed.outputPath).extension().string(), ".zstd");

    // The replicated blob is the compressed file, and it names the content.
    const auto& replicated = std::get<ReplicationResult>(record.steps[2].result);
    EXPECT_EQ(replicated.replicationAchieved, 2u);
    EXPECT_EQ(record.contentId, sha256File(compressed.outputPath));
    EXPECT_EQ(replicated.contentId, record.contentId);
}

TEST_F(StoragePipelineTest, SkippedStagesLeaveNoTrail) {
    writeFile(dir_.file("plain.txt"), "only replicate me");
    StoragePipeline pipeline(makeConfig());

    PipelineRecord record = pipeline.storeFile(dir_.file("plain.txt"), false, false, true);
    ASSERT_TRUE(record.ok());
    ASSERT_EQ(record.steps.size(), 1u);
    EXPECT_EQ(record.steps[0].name, "replication");
    EXPECT_EQ(record.contentId, sha256File(dir_.file("plain.txt")));
    EXPECT_EQ(record.findStage("compression"), nullptr);
}

TEST_F(StoragePipelineTest, NoStagesStillIdentifiesContent) {
    writeFile(dir_.file("plain.txt"), "identified");
    StoragePipeline pipeline(makeConfig());

    PipelineRecord record = pipeline.storeFile(dir_.file("plain.txt"), false, false, false);
    ASSERT_TRUE(record.ok());
    EXPECT_TRUE(record.steps.empty());
    EXPECT_EQ(record.contentId, sha256File(dir_.file("plain.txt")));
    EXPECT_TRUE(pipeline.record(record.contentId).has_value());
}

TEST_F(StoragePipelineTest, CapacityTracksOriginalSizes) {
    PipelineConfig config = makeConfig();
    config.maxCapacityBytes = 100000;
    StoragePipeline pipeline(config);

    writeFile(dir_.file("a.txt"), std::string(20000, 'a'));
    writeFile(dir_.file("b.txt"), std::string(30000, 'b'));

    PipelineRecord first = pipeline.storeFile(dir_.file("a.txt"));
    EXPECT_EQ(first.totalSize, 20000u);
    EXPECT_DOUBLE_EQ(first.capacityUsedPercent, 20.0);

    PipelineRecord second = pipeline.storeFile(dir_.file("b.txt"));
    EXPECT_EQ(second.totalSize, 50000u);
    EXPECT_DOUBLE_EQ(second.capacityUsedPercent, 50.0);
    EXPECT_DOUBLE_EQ(second.totalSizeTb, 50000.0 / static_cast<double>(BYTES_PER_TB));

    StorageStats stats = pipeline.stats();
    EXPECT_EQ(stats.totalFiles, 2u);
    EXPECT_EQ(stats.totalSizeBytes, 50000u);
    EXPECT_DOUBLE_EQ(stats.capacityUsedPercent, 50.0);
    EXPECT_EQ(stats.dedup.chunkSize, 1024u);
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().gaugeValue("chunkvault_capacity_used_percent"), 50.0);
}

TEST_F(StoragePipelineTest, StoringSameContentTwiceKeepsFirstRecord) {
    writeFile(dir_.file("one.txt"), "same bytes");
    writeFile(dir_.file("two.txt"), "same bytes");
    StoragePipeline pipeline(makeConfig());

    PipelineRecord first = pipeline.storeFile(dir_.file("one.txt"), false, false, true);
    PipelineRecord second = pipeline.storeFile(dir_.file("two.txt"), false, false, true);
    EXPECT_EQ(first.contentId, second.contentId);
    EXPECT_EQ(second.totalSize, 20u);

    auto stored = pipeline.record(first.contentId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->originalFile, dir_.file("one.txt"));
    EXPECT_EQ(pipeline.stats().totalFiles, 1u);
}

TEST_F(StoragePipelineTest, UnreadableInputIsNotAccounted) {
    StoragePipeline pipeline(makeConfig());
    PipelineRecord record = pipeline.storeFile(dir_.file("absent.bin"));
    EXPECT_FALSE(record.ok());
    EXPECT_TRUE(record.steps.empty());
    EXPECT_EQ(pipeline.stats().totalSizeBytes, 0u);
    EXPECT_EQ(pipeline.stats().totalFiles, 0u);
}

TEST_F(StoragePipelineTest, FailedCompressionPassesOriginalOn) {
    PipelineConfig config = makeConfig();
    config.compressionAlgorithm = CompressionAlgorithm::BZIP2;
    config.compressionLevel = 42;
    writeFile(dir_.file("input.txt"), "level out of range");
    StoragePipeline pipeline(config);

    PipelineRecord record = pipeline.storeFile(dir_.file("input.txt"), false, true, true);
    ASSERT_TRUE(record.ok());
    ASSERT_EQ(record.steps.size(), 2u);
    EXPECT_FALSE(std::get<CompressionResult>(record.steps[0].result).ok());
    EXPECT_EQ(record.contentId, sha256File(dir_.file("input.txt")));

    ASSERT_TRUE(pipeline.retrieveFile(record.contentId, dir_.file("restored.txt")));
    EXPECT_EQ(readFile(dir_.file("restored.txt")), "level out of range");
}

TEST_F(StoragePipelineTest, RetrieveFromReplicaDecompresses) {
    const std::string data = patternedBytes(5000) + std::string(20000, 'r');
    writeFile(dir_.file("input.bin"), data);
    StoragePipeline pipeline(makeConfig());

    PipelineRecord record = pipeline.storeFile(dir_.file("input.bin"));
    ASSERT_TRUE(pipeline.retrieveFile(record.contentId, dir_.file("restored.bin")));
    EXPECT_EQ(readFile(dir_.file("restored.bin")), data);
    EXPECT_FALSE(fs::exists(dir_.file("restored.bin.fetched")));
}

TEST_F(StoragePipelineTest, RetrieveFallsBackToStagingCopy) {
    const std::string data = std::string(9000, 's');
    writeFile(dir_.file("input.bin"), data);
    StoragePipeline pipeline(makeConfig());

    PipelineRecord record = pipeline.storeFile(dir_.file("input.bin"));
    for (const auto& location : pipeline.replication().locationsFor(record.contentId)) {
        fs::remove(location);
    }
    ASSERT_TRUE(pipeline.retrieveFile(record.contentId, dir_.file("restored.bin")));
    EXPECT_EQ(readFile(dir_.file("restored.bin")), data);
}

TEST_F(StoragePipelineTest, RetrieveFromChunksWhenOnlyDeduplicated) {
    const std::string data = patternedBytes(4500);
    writeFile(dir_.file("input.bin"), data);
    StoragePipeline pipeline(makeConfig());

    PipelineRecord record = pipeline.storeFile(dir_.file("input.bin"), true, false, false);
    ASSERT_TRUE(record.ok());
    ASSERT_TRUE(pipeline.retrieveFile(record.contentId, dir_.file("restored.bin")));
    EXPECT_EQ(readFile(dir_.file("restored.bin")), data);
    EXPECT_FALSE(pipeline.retrieveFile("unknown-id", dir_.file("nothing.bin")));
}

TEST_F(StoragePipelineTest, OverwrittenPathStillRetrievesEarlierVersion) {
    const std::string firstData = patternedBytes(3000, 11);
    const std::string secondData = patternedBytes(3000, 12);
    StoragePipeline pipeline(makeConfig());

    writeFile(dir_.file("doc.bin"), firstData);
    PipelineRecord first = pipeline.storeFile(dir_.file("doc.bin"), true, false, false);
    ASSERT_TRUE(first.ok()) << first.error;

    writeFile(dir_.file("doc.bin"), secondData);
    PipelineRecord second = pipeline.storeFile(dir_.file("doc.bin"), true, false, false);
    ASSERT_TRUE(second.ok()) << second.error;
    ASSERT_NE(first.contentId, second.contentId);

    ASSERT_TRUE(pipeline.retrieveFile(first.contentId, dir_.file("first.bin")));
    EXPECT_EQ(readFile(dir_.file("first.bin")), firstData);
    EXPECT_EQ(sha256File(dir_.file("first.bin")), first.contentId);

    ASSERT_TRUE(pipeline.retrieveFile(second.contentId, dir_.file("second.bin")));
    EXPECT_EQ(readFile(dir_.file("second.bin")), secondData);
}

TEST_F(StoragePipelineTest, ConcurrentStoresAccountEveryFile) {
    PipelineConfig config = makeConfig();
    config.maxCapacityBytes = 1000000;
    StoragePipeline pipeline(config);

    constexpr int kFiles = 8;
    for (int i = 0; i < kFiles; ++i) {
        writeFile(dir_.file("f" + std::to_string(i) + ".bin"),
                  patternedBytes(2048, static_cast<unsigned>(i + 1)));
    }
    std::vector<std::thread> workers;
    for (int i = 0; i < kFiles; ++i) {
        workers.emplace_back([&pipeline, this, i] {
            pipeline.storeFile(dir_.file("f" + std::to_string(i) + ".bin"));
        });
    }
    for (auto& t : workers) t.join();

    StorageStats stats = pipeline.stats();
    EXPECT_EQ(stats.totalFiles, static_cast<size_t>(kFiles));
    EXPECT_EQ(stats.totalSizeBytes, static_cast<uint64_t>(kFiles * 2048));
    EXPECT_EQ(stats.dedup.totalChunks, static_cast<size_t>(kFiles * 2));
}

TEST_F(StoragePipelineTest, SmartCollectionStoresOrganizedFiles) {
    writeFile(dir_.file("inbox/a.txt"), std::string(3000, 'a'));
    writeFile(dir_.file("inbox/b.json"), "{\"k\": 1}");
    StoragePipeline pipeline(makeConfig());

    CollectionStats stats = pipeline.smartCollection(dir_.file("inbox"));
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.errors, 0u);
    EXPECT_EQ(stats.categories["documents"], 1u);
    EXPECT_EQ(stats.categories["data"], 1u);

    StorageStats storage = pipeline.stats();
    EXPECT_EQ(storage.totalFiles, 2u);
    EXPECT_EQ(storage.totalSizeBytes, 3000u + 8u);
    // Collections are never replicated.
    EXPECT_TRUE(fs::is_empty(dir_.path() / "replica_a"));

    // A second collection only stores the files it organized itself.
    writeFile(dir_.file("inbox2/c.py"), "print(1)");
    pipeline.smartCollection(dir_.file("inbox2"));
    EXPECT_EQ(pipeline.stats().totalFiles, 3u);
}

TEST_F(StoragePipelineTest, RecordSerializesToJson) {
    writeFile(dir_.file("input.txt"), std::string(4096, 'j'));
    StoragePipeline pipeline(makeConfig());
    PipelineRecord record = pipeline.storeFile(dir_.file("input.txt"));

    nlohmann::json j = toJson(record);
    EXPECT_EQ(j["file_id"].get<std::string>(), record.contentId);
    ASSERT_EQ(j["steps"].size(), 3u);
    EXPECT_EQ(j["steps"][0]["stage"], "deduplication");
    EXPECT_EQ(j["steps"][1]["result"]["algorithm"], "zstd");
    EXPECT_EQ(j["steps"][2]["result"]["replication_achieved"], 2);

    nlohmann::json stats = toJson(pipeline.stats());
    EXPECT_EQ(stats["total_files"], 1);
    EXPECT_EQ(stats["deduplication_stats"]["chunk_size"], 1024);
}

TEST_F(StoragePipelineTest, InventoryReportsVaultLeftByEarlierRun) {
    writeFile(dir_.file("inbox/a.txt"), patternedBytes(2048, 5));
    writeFile(dir_.file("inbox/b.json"), "{\"k\": 2}");
    {
        StoragePipeline pipeline(makeConfig());
        pipeline.smartCollection(dir_.file("inbox"));
        ASSERT_TRUE(pipeline.cataloger().saveCatalog(
            (dir_.path() / "vault" / "metadata" / "catalog.json").string()));
    }

    // A fresh pipeline has an empty registry but sees the same vault.
    StoragePipeline reopened(makeConfig());
    EXPECT_EQ(reopened.stats().totalFiles, 0u);

    StorageInventory inv = reopened.inventory();
    EXPECT_EQ(inv.chunkFiles, 3u); // two windows of a.txt, one of b.json
    EXPECT_EQ(inv.chunkBytes, 2048u + 8u);
    EXPECT_EQ(inv.compressedFiles, 2u);
    EXPECT_GT(inv.compressedBytes, 0u);
    EXPECT_EQ(inv.catalogEntries, 2u);

    nlohmann::json j = toJson(inv);
    EXPECT_EQ(j["chunk_files"], 3);
    EXPECT_EQ(j["catalog_entries"], 2);
}

TEST_F(StoragePipelineTest, InventoryOfEmptyVaultIsZero) {
    StoragePipeline pipeline(makeConfig());
    writeFile((dir_.path() / "vault" / "metadata" / "catalog.json").string(), "not json");

    StorageInventory inv = pipeline.inventory();
    EXPECT_EQ(inv.chunkFiles, 0u);
    EXPECT_EQ(inv.compressedFiles, 0u);
    EXPECT_EQ(inv.catalogEntries, 0u);
}
