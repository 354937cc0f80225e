#include "chunkvault/pipeline/pipeline_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace chunkvault {

namespace {

CompressionAlgorithm parseAlgorithm(const std::string &name) {
  auto algo = algorithmFromString(name);
  if (!algo) {
    throw std::runtime_error("Unknown compression algorithm: " + name);
  }
  return *algo;
}

void applyNode(const YAML::Node &node, PipelineConfig &config) {
  if (!node || node.IsNull())
    return;
  if (!node.IsMap()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  if (node["base_path"])
    config.basePath = node["base_path"].as<std::string>();
  if (node["storage_locations"])
    config.storageLocations =
        node["storage_locations"].as<std::vector<std::string>>();
  if (node["replication_factor"])
    config.replicationFactor = node["replication_factor"].as<size_t>();
  if (node["max_size_tb"])
    config.maxCapacityBytes = static_cast<uint64_t>(
        node["max_size_tb"].as<double>() * static_cast<double>(BYTES_PER_TB));
  if (node["max_capacity_bytes"])
    config.maxCapacityBytes = node["max_capacity_bytes"].as<uint64_t>();
  if (node["chunk_size"])
    config.chunkSize = node["chunk_size"].as<size_t>();
  if (node["compression_algorithm"])
    config.compressionAlgorithm =
        parseAlgorithm(node["compression_algorithm"].as<std::string>());
  if (node["compression_level"])
    config.compressionLevel = node["compression_level"].as<int>();
  if (node["log_file"])
    config.logFile = node["log_file"].as<std::string>();
  if (node["log_level"])
    config.logLevel = node["log_level"].as<std::string>();
}

} // namespace

PipelineConfig parsePipelineConfig(const std::string &yamlText) {
  PipelineConfig config;
  try {
    applyNode(YAML::Load(yamlText), config);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("Invalid configuration: ") +
                             e.what());
  }
  return config;
}

void applyEnvironmentOverrides(PipelineConfig &config) {
  if (const char *env = std::getenv("CHUNKVAULT_BASE_PATH"))
    config.basePath = env;
  if (const char *env = std::getenv("CHUNKVAULT_COMPRESSION_ALGO"))
    config.compressionAlgorithm = parseAlgorithm(env);
  try {
    if (const char *env = std::getenv("CHUNKVAULT_COMPRESSION_LEVEL"))
      config.compressionLevel = std::stoi(env);
    if (const char *env = std::getenv("CHUNKVAULT_REPLICATION_FACTOR"))
      config.replicationFactor = static_cast<size_t>(std::stoul(env));
  } catch (const std::logic_error &e) {
    throw std::runtime_error(std::string("Invalid numeric override: ") +
                             e.what());
  }
}

PipelineConfig loadPipelineConfig(const std::string &path) {
  std::string cfg = path;
  if (cfg.empty()) {
    const char *env = std::getenv("CHUNKVAULT_CONFIG");
    cfg = env ? env : "chunkvault_config.yaml";
  }

  PipelineConfig config;
  std::error_code ec;
  if (std::filesystem::exists(cfg, ec)) {
    try {
      applyNode(YAML::LoadFile(cfg), config);
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Invalid configuration in " + cfg + ": " +
                               e.what());
    }
  }
  applyEnvironmentOverrides(config);
  return config;
}

} // namespace chunkvault
