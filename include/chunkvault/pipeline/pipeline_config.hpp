#pragma once
#include "chunkvault/compression/compression_codec.hpp"
#include "chunkvault/storage/chunk_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault {

inline constexpr uint64_t BYTES_PER_TB = 1024ULL * 1024 * 1024 * 1024;

/**
 * @brief Construction-time settings for StoragePipeline.
 *
 * An empty @c storageLocations list means "replicate into basePath".
 */
struct PipelineConfig {
  std::string basePath = "chunkvault_data";
  std::vector<std::string> storageLocations;
  size_t replicationFactor = 2;
  uint64_t maxCapacityBytes = 10 * BYTES_PER_TB;
  size_t chunkSize = DEFAULT_CHUNK_SIZE;
  CompressionAlgorithm compressionAlgorithm = CompressionAlgorithm::ZSTD;
  int compressionLevel = CompressionCodec::DEFAULT_LEVEL;
  std::string logFile;
  std::string logLevel = "info";
};

/**
 * @brief Load settings from a YAML file, then apply environment overrides.
 *
 * @param path Config file; empty uses $CHUNKVAULT_CONFIG, falling back to
 *        "chunkvault_config.yaml". A missing file yields the defaults.
 * @throw std::runtime_error on malformed YAML, wrong value types or an
 *        unknown compression algorithm.
 */
PipelineConfig loadPipelineConfig(const std::string &path = "");

/// Parse settings from YAML text. Environment overrides are not applied.
PipelineConfig parsePipelineConfig(const std::string &yamlText);

/**
 * @brief Apply CHUNKVAULT_BASE_PATH, CHUNKVAULT_COMPRESSION_ALGO,
 * CHUNKVAULT_COMPRESSION_LEVEL and CHUNKVAULT_REPLICATION_FACTOR.
 */
void applyEnvironmentOverrides(PipelineConfig &config);

} // namespace chunkvault
