#include "chunkvault/pipeline/storage_pipeline.hpp"
#include "chunkvault/utilities/digest.hpp"
#include "chunkvault/utilities/logger.h"
#include "chunkvault/utilities/metrics.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

std::vector<std::string> resolveLocations(const PipelineConfig &config) {
  if (config.storageLocations.empty()) {
    return {config.basePath};
  }
  return config.storageLocations;
}

const PipelineConfig &validated(const PipelineConfig &config) {
  if (config.maxCapacityBytes == 0) {
    throw std::invalid_argument("Maximum capacity must be greater than zero");
  }
  return config;
}

double toTb(uint64_t bytes) {
  return static_cast<double>(bytes) / static_cast<double>(BYTES_PER_TB);
}

nlohmann::json stageToJson(const StageResult &result) {
  return std::visit(
      [](const auto &r) -> nlohmann::json {
        using T = std::decay_t<decltype(r)>;
        nlohmann::json j;
        if (!r.ok()) {
          j["error"] = r.error;
          return j;
        }
        if constexpr (std::is_same_v<T, DedupResult>) {
          j["file_path"] = r.filePath;
          j["total_chunks"] = r.totalChunks;
          j["new_chunks"] = r.newChunks;
          j["duplicate_chunks"] = r.duplicateChunks;
          j["total_size"] = r.totalSize;
          j["saved_size"] = r.savedSize;
          j["deduplication_ratio"] = r.dedupRatio;
        } else if constexpr (std::is_same_v<T, CompressionResult>) {
          j["original_size"] = r.originalSize;
          j["compressed_size"] = r.compressedSize;
          j["compression_ratio"] = r.compressionRatio;
          j["algorithm"] = r.algorithm;
          j["output_path"] = r.outputPath;
        } else {
          j["content_id"] = r.contentId;
          j["stored_locations"] = r.storedLocations;
          nlohmann::json failed = nlohmann::json::array();
          for (const auto &[location, message] : r.failedLocations) {
            failed.push_back({{"location", location}, {"error", message}});
          }
          j["failed_locations"] = failed;
          j["replication_achieved"] = r.replicationAchieved;
        }
        return j;
      },
      result);
}

// Regular files directly under @p dir and their total size.
std::pair<size_t, uint64_t> countFiles(const fs::path &dir) {
  size_t count = 0;
  uint64_t bytes = 0;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return {0, 0};
  }
  fs::directory_iterator it(dir, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code sizeEc;
    if (!it->is_regular_file(sizeEc))
      continue;
    const auto size = it->file_size(sizeEc);
    if (sizeEc)
      continue;
    ++count;
    bytes += static_cast<uint64_t>(size);
  }
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN, "Cannot list " + dir.string() +
                                                  ": " + ec.message());
  }
  return {count, bytes};
}

} // namespace

const PipelineStage *PipelineRecord::findStage(const std::string &name) const {
  for (const auto &stage : steps) {
    if (stage.name == name)
      return &stage;
  }
  return nullptr;
}

nlohmann::json toJson(const PipelineRecord &record) {
  nlohmann::json j;
  j["original_file"] = record.originalFile;
  j["original_size"] = record.originalSize;
  if (!record.ok()) {
    j["error"] = record.error;
    return j;
  }
  nlohmann::json steps = nlohmann::json::array();
  for (const auto &stage : record.steps) {
    steps.push_back({{"stage", stage.name}, {"result", stageToJson(stage.result)}});
  }
  j["steps"] = steps;
  j["file_id"] = record.contentId;
  j["total_size"] = record.totalSize;
  j["total_size_tb"] = record.totalSizeTb;
  j["capacity_used_percent"] = record.capacityUsedPercent;
  return j;
}

nlohmann::json toJson(const StorageStats &stats) {
  nlohmann::json j;
  j["total_files"] = stats.totalFiles;
  j["total_size_bytes"] = stats.totalSizeBytes;
  j["total_size_tb"] = stats.totalSizeTb;
  j["max_size_tb"] = stats.maxSizeTb;
  j["capacity_used_percent"] = stats.capacityUsedPercent;
  j["deduplication_stats"] = {{"total_chunks", stats.dedup.totalChunks},
                              {"total_files", stats.dedup.totalFiles},
                              {"chunk_size", stats.dedup.chunkSize}};
  return j;
}

nlohmann::json toJson(const StorageInventory &inventory) {
  nlohmann::json j;
  j["chunk_files"] = inventory.chunkFiles;
  j["chunk_bytes"] = inventory.chunkBytes;
  j["compressed_files"] = inventory.compressedFiles;
  j["compressed_bytes"] = inventory.compressedBytes;
  j["catalog_entries"] = inventory.catalogEntries;
  return j;
}

StoragePipeline::StoragePipeline(PipelineConfig config)
    : config_(validated(config)), chunkStore_(config_.chunkSize),
      codec_(config_.compressionAlgorithm, config_.compressionLevel),
      replication_(resolveLocations(config_), config_.replicationFactor),
      cataloger_((fs::path(config_.basePath) / "organized").string()) {
  std::error_code ec;
  fs::create_directories(fs::path(config_.basePath) / "metadata", ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Cannot create metadata directory under " +
                                  config_.basePath + ": " + ec.message());
  }
}

std::string StoragePipeline::nextStagingPath() {
  const fs::path dir = fs::path(config_.basePath) / "compressed";
  std::error_code ec;
  fs::create_directories(dir, ec);
  // A failure here surfaces as the compression stage's own I/O error.
  const uint64_t seq = stagingSequence_.fetch_add(1);
  return (dir / (std::to_string(seq) + "." +
                 algorithmToString(codec_.defaultAlgorithm())))
      .string();
}

PipelineRecord StoragePipeline::storeFile(const std::string &path,
                                          bool deduplicate, bool compress,
                                          bool replicate) {
  PipelineRecord record;
  record.originalFile = path;

  std::error_code ec;
  record.originalSize = static_cast<uint64_t>(fs::file_size(path, ec));
  if (ec) {
    record.originalSize = 0;
    record.error = "Cannot read " + path + ": " + ec.message();
    Logger::getInstance().log(LogLevel::ERROR, record.error);
    return record;
  }

  std::string activeFile = path;

  if (deduplicate) {
    const std::string dedupDir =
        (fs::path(config_.basePath) / "deduplicated").string();
    record.steps.push_back(
        {DEDUP_STAGE, chunkStore_.deduplicateFile(path, dedupDir)});
  }

  if (compress) {
    CompressionResult compressed =
        codec_.compressFile(activeFile, nextStagingPath());
    if (compressed.ok()) {
      activeFile = compressed.outputPath;
    }
    record.steps.push_back({COMPRESSION_STAGE, std::move(compressed)});
  }

  if (replicate) {
    ReplicationResult replicated = replication_.store(activeFile);
    if (replicated.ok()) {
      record.contentId = replicated.contentId;
    }
    record.steps.push_back({REPLICATION_STAGE, std::move(replicated)});
  }

  if (record.contentId.empty()) {
    try {
      record.contentId = sha256File(activeFile);
    } catch (const std::exception &e) {
      record.error = e.what();
      Logger::getInstance().log(LogLevel::ERROR, "Cannot identify " +
                                                     activeFile + ": " +
                                                     record.error);
      return record;
    }
  }

  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    totalSize_ += record.originalSize;
    record.totalSize = totalSize_;
    record.totalSizeTb = toTb(totalSize_);
    record.capacityUsedPercent = static_cast<double>(totalSize_) /
                                 static_cast<double>(config_.maxCapacityBytes) *
                                 100.0;
    // Equal ids mean equal content, so the first record stays authoritative.
    registry_.emplace(record.contentId, record);
  }

  MetricsRegistry::instance().setGauge("chunkvault_capacity_used_percent",
                                       record.capacityUsedPercent);
  MetricsRegistry::instance().incrementCounter("chunkvault_files_stored_total");
  Logger::getInstance().log(LogLevel::INFO,
                            "Stored " + path + " as " + record.contentId +
                                " (" + std::to_string(record.steps.size()) +
                                " stages)");
  return record;
}

CollectionStats StoragePipeline::smartCollection(const std::string &source,
                                                 bool autoCategorize,
                                                 bool deduplicate,
                                                 bool compress) {
  std::unordered_set<std::string> alreadyStored;
  for (const auto &entry : cataloger_.entries()) {
    alreadyStored.insert(entry.storedPath);
  }

  CollectionStats stats = cataloger_.collectAndOrganize(source, autoCategorize);
  if (!deduplicate && !compress) {
    return stats;
  }
  for (const auto &entry : cataloger_.entries()) {
    if (entry.storedPath.empty() || alreadyStored.count(entry.storedPath))
      continue;
    PipelineRecord stored =
        storeFile(entry.storedPath, deduplicate, compress, false);
    if (!stored.ok()) {
      stats.errors++;
    }
  }
  return stats;
}

bool StoragePipeline::retrieveFile(const std::string &contentId,
                                   const std::string &outputPath) const {
  auto rec = record(contentId);
  if (!rec) {
    return false;
  }

  const CompressionResult *compression = nullptr;
  if (const auto *stage = rec->findStage(COMPRESSION_STAGE)) {
    const auto &result = std::get<CompressionResult>(stage->result);
    if (result.ok())
      compression = &result;
  }
  std::optional<CompressionAlgorithm> algorithm;
  if (compression) {
    algorithm = algorithmFromString(compression->algorithm);
  }

  bool replicated = false;
  if (const auto *stage = rec->findStage(REPLICATION_STAGE)) {
    const auto &result = std::get<ReplicationResult>(stage->result);
    replicated = result.ok() && result.replicationAchieved > 0;
  }

  if (replicated) {
    if (!compression) {
      return replication_.retrieve(contentId, outputPath);
    }
    const std::string fetched = outputPath + ".fetched";
    bool ok = replication_.retrieve(contentId, fetched) &&
              codec_.decompressFile(fetched, outputPath, algorithm);
    std::error_code ec;
    fs::remove(fetched, ec);
    if (ok)
      return true;
  }

  if (compression) {
    return codec_.decompressFile(compression->outputPath, outputPath,
                                 algorithm);
  }

  // The record's own digest list, since the path index holds only the
  // latest version of a file.
  if (const auto *stage = rec->findStage(DEDUP_STAGE)) {
    const auto &dedup = std::get<DedupResult>(stage->result);
    if (dedup.ok()) {
      return chunkStore_.reconstructChunks(dedup.chunkDigests, outputPath,
                                           rec->contentId);
    }
  }
  return false;
}

std::optional<PipelineRecord>
StoragePipeline::record(const std::string &contentId) const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  auto it = registry_.find(contentId);
  if (it == registry_.end()) {
    return std::nullopt;
  }
  return it->second;
}

StorageStats StoragePipeline::stats() const {
  StorageStats s;
  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    s.totalFiles = registry_.size();
    s.totalSizeBytes = totalSize_;
  }
  s.totalSizeTb = toTb(s.totalSizeBytes);
  s.maxSizeTb = toTb(config_.maxCapacityBytes);
  s.capacityUsedPercent = static_cast<double>(s.totalSizeBytes) /
                          static_cast<double>(config_.maxCapacityBytes) * 100.0;
  s.dedup = chunkStore_.stats();
  return s;
}

StorageInventory StoragePipeline::inventory() const {
  const fs::path base(config_.basePath);
  StorageInventory inv;
  std::tie(inv.chunkFiles, inv.chunkBytes) =
      countFiles(base / "deduplicated" / "chunks");
  std::tie(inv.compressedFiles, inv.compressedBytes) =
      countFiles(base / "compressed");

  const fs::path catalogFile = base / "metadata" / "catalog.json";
  std::ifstream in(catalogFile);
  if (in) {
    nlohmann::json catalog = nlohmann::json::parse(in, nullptr, false);
    if (catalog.is_object()) {
      inv.catalogEntries = catalog.size();
    } else {
      Logger::getInstance().log(LogLevel::WARN,
                                "Ignoring unreadable catalog " +
                                    catalogFile.string());
    }
  }
  return inv;
}

} // namespace chunkvault
