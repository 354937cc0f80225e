#ifndef CHUNKVAULT_STORAGE_PIPELINE_HPP
#define CHUNKVAULT_STORAGE_PIPELINE_HPP

#include "chunkvault/catalog/file_cataloger.hpp"
#include "chunkvault/compression/compression_codec.hpp"
#include "chunkvault/pipeline/pipeline_config.hpp"
#include "chunkvault/replication/ReplicationManager.h"
#include "chunkvault/storage/chunk_store.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace chunkvault {

using StageResult =
    std::variant<DedupResult, CompressionResult, ReplicationResult>;

/** One executed stage in a PipelineRecord trail. */
struct PipelineStage {
  std::string name; ///< "deduplication", "compression" or "replication"
  StageResult result;
};

/**
 * @brief Result of one StoragePipeline::storeFile() call.
 *
 * Totals are snapshots taken right after this call was accounted.
 */
struct PipelineRecord {
  std::string originalFile;
  uint64_t originalSize{0};
  std::vector<PipelineStage> steps;
  std::string contentId;
  uint64_t totalSize{0};
  double totalSizeTb{0.0};
  double capacityUsedPercent{0.0};
  std::string error; ///< Set when the input could not be processed at all

  bool ok() const { return error.empty(); }
  const PipelineStage *findStage(const std::string &name) const;
};

struct StorageStats {
  size_t totalFiles{0};
  uint64_t totalSizeBytes{0};
  double totalSizeTb{0.0};
  double maxSizeTb{0.0};
  double capacityUsedPercent{0.0};
  ChunkStore::Stats dedup;
};

/** What a vault directory holds on disk, independent of any process. */
struct StorageInventory {
  size_t chunkFiles{0};
  uint64_t chunkBytes{0};
  size_t compressedFiles{0};
  uint64_t compressedBytes{0};
  size_t catalogEntries{0};
};

nlohmann::json toJson(const PipelineRecord &record);
nlohmann::json toJson(const StorageStats &stats);
nlohmann::json toJson(const StorageInventory &inventory);

/**
 * @brief Runs files through deduplicate -> compress -> replicate.
 *
 * Each stage is optional per call. A skipped or failed stage passes the
 * current file on unchanged. Capacity is accounted with the original file
 * size whatever the stages did to the physical footprint.
 *
 * storeFile() may be called from several threads at once.
 */
class StoragePipeline {
public:
  static constexpr const char *DEDUP_STAGE = "deduplication";
  static constexpr const char *COMPRESSION_STAGE = "compression";
  static constexpr const char *REPLICATION_STAGE = "replication";

  /**
   * @throw std::invalid_argument for a zero chunk size, replication factor
   *        or capacity.
   */
  explicit StoragePipeline(PipelineConfig config);

  PipelineRecord storeFile(const std::string &path, bool deduplicate = true,
                           bool compress = true, bool replicate = true);

  /**
   * @brief Catalog @p source, then store every organized copy without
   * replication.
   */
  CollectionStats smartCollection(const std::string &source,
                                  bool autoCategorize = true,
                                  bool deduplicate = true,
                                  bool compress = true);

  /**
   * @brief Restore the original bytes of a stored file.
   *
   * Uses a replica when one exists, else the compressed staging copy, else
   * the chunk store. Compressed blobs are decompressed on the way out.
   */
  bool retrieveFile(const std::string &contentId,
                    const std::string &outputPath) const;

  std::optional<PipelineRecord> record(const std::string &contentId) const;
  StorageStats stats() const;

  /**
   * @brief Scan the vault under the configured base path.
   *
   * Counts deduplicated chunks, compressed staging copies and the entries of
   * `metadata/catalog.json`, including those left by earlier processes.
   */
  StorageInventory inventory() const;

  const PipelineConfig &config() const { return config_; }
  ChunkStore &chunkStore() { return chunkStore_; }
  const CompressionCodec &codec() const { return codec_; }
  ReplicationManager &replication() { return replication_; }
  FileCataloger &cataloger() { return cataloger_; }

private:
  std::string nextStagingPath();

  PipelineConfig config_;
  ChunkStore chunkStore_;
  CompressionCodec codec_;
  ReplicationManager replication_;
  FileCataloger cataloger_;

  std::atomic<uint64_t> stagingSequence_{0};
  mutable std::mutex registryMutex_;
  std::unordered_map<std::string, PipelineRecord> registry_;
  uint64_t totalSize_{0};
};

} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_PIPELINE_HPP
