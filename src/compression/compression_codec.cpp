#include "chunkvault/compression/compression_codec.hpp"
#include "chunkvault/utilities/logger.h"
#include "chunkvault/utilities/metrics.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkvault {

std::string algorithmToString(CompressionAlgorithm algo) {
  switch (algo) {
  case CompressionAlgorithm::ZSTD:
    return "zstd";
  case CompressionAlgorithm::ZLIB:
    return "zlib";
  case CompressionAlgorithm::BZIP2:
    return "bz2";
  }
  return "unknown";
}

std::optional<CompressionAlgorithm>
algorithmFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "zstd")
    return CompressionAlgorithm::ZSTD;
  if (lower == "zlib")
    return CompressionAlgorithm::ZLIB;
  if (lower == "bz2" || lower == "bzip2")
    return CompressionAlgorithm::BZIP2;
  return std::nullopt;
}

const std::vector<CompressionAlgorithm> &supportedAlgorithms() {
  static const std::vector<CompressionAlgorithm> all = {
      CompressionAlgorithm::ZSTD, CompressionAlgorithm::ZLIB,
      CompressionAlgorithm::BZIP2};
  return all;
}

CompressionCodec::CompressionCodec(CompressionAlgorithm defaultAlgorithm,
                                   int defaultLevel)
    : defaultAlgorithm_(defaultAlgorithm), defaultLevel_(defaultLevel) {}

CompressionResult
CompressionCodec::compressFile(const std::string &inputPath,
                               const std::string &outputPath,
                               std::optional<CompressionAlgorithm> algorithm,
                               std::optional<int> level) const {
  CompressionResult result;
  const CompressionAlgorithm algo = algorithm.value_or(defaultAlgorithm_);
  const int lvl = level.value_or(defaultLevel_);
  result.algorithm = algorithmToString(algo);
  result.outputPath =
      outputPath.empty() ? inputPath + ".compressed" : outputPath;
  bool outputCreated = false;

  try {
    auto codec = makeStreamCodec(algo);
    if (lvl < codec->minLevel() || lvl > codec->maxLevel()) {
      result.error = "Invalid " + result.algorithm + " compression level " +
                     std::to_string(lvl) + " (expected " +
                     std::to_string(codec->minLevel()) + ".." +
                     std::to_string(codec->maxLevel()) + ")";
      Logger::getInstance().log(LogLevel::WARN, result.error);
      return result;
    }

    std::ifstream in(inputPath, std::ios::binary);
    if (!in.is_open()) {
      throw std::runtime_error("Cannot open compression input: " + inputPath);
    }
    {
      std::ofstream out(result.outputPath, std::ios::binary | std::ios::trunc);
      if (!out.is_open()) {
        throw std::runtime_error("Cannot open compression output: " +
                                 result.outputPath);
      }
      outputCreated = true;
      codec->compress(in, out, lvl);
      out.flush();
      if (!out) {
        throw std::runtime_error("Write error on " + result.outputPath);
      }
    }

    result.originalSize = static_cast<size_t>(fs::file_size(inputPath));
    result.compressedSize =
        static_cast<size_t>(fs::file_size(result.outputPath));
    result.compressionRatio =
        result.compressedSize > 0
            ? static_cast<double>(result.originalSize) / result.compressedSize
            : 0.0;
  } catch (const std::exception &e) {
    result.error = e.what();
    if (outputCreated) {
      std::error_code ec;
      fs::remove(result.outputPath, ec);
    }
    MetricsRegistry::instance().incrementCounter(
        "chunkvault_compression_failures_total", 1.0,
        {{"algorithm", result.algorithm}});
    Logger::getInstance().log(LogLevel::ERROR, "Compression of " + inputPath +
                                                   " failed: " + result.error);
    return result;
  }

  MetricsRegistry::instance().observe("chunkvault_compression_ratio",
                                      result.compressionRatio,
                                      {{"algorithm", result.algorithm}});
  Logger::getInstance().log(
      LogLevel::DEBUG, "Compressed " + inputPath + " with " +
                           result.algorithm + ": " +
                           std::to_string(result.originalSize) + " -> " +
                           std::to_string(result.compressedSize) + " bytes");
  return result;
}

CompressionResult
CompressionCodec::compressFile(const std::string &inputPath,
                               const std::string &outputPath,
                               const std::string &algorithmName,
                               std::optional<int> level) const {
  auto algo = algorithmFromString(algorithmName);
  if (!algo) {
    CompressionResult result;
    result.algorithm = algorithmName;
    result.outputPath =
        outputPath.empty() ? inputPath + ".compressed" : outputPath;
    result.error = "Unknown algorithm: " + algorithmName;
    Logger::getInstance().log(LogLevel::WARN, result.error);
    return result;
  }
  return compressFile(inputPath, outputPath, *algo, level);
}

bool CompressionCodec::decompressFile(
    const std::string &inputPath, const std::string &outputPath,
    std::optional<CompressionAlgorithm> algorithm) const {
  const CompressionAlgorithm algo = algorithm.value_or(defaultAlgorithm_);
  bool outputCreated = false;
  try {
    auto codec = makeStreamCodec(algo);
    std::ifstream in(inputPath, std::ios::binary);
    if (!in.is_open()) {
      throw std::runtime_error("Cannot open decompression input: " +
                               inputPath);
    }
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Cannot open decompression output: " +
                               outputPath);
    }
    outputCreated = true;
    codec->decompress(in, out);
    out.flush();
    if (!out) {
      throw std::runtime_error("Write error on " + outputPath);
    }
  } catch (const std::exception &e) {
    if (outputCreated) {
      std::error_code ec;
      fs::remove(outputPath, ec);
    }
    Logger::getInstance().log(LogLevel::ERROR,
                              "Decompression error (" +
                                  algorithmToString(algo) + ") for " +
                                  inputPath + ": " + e.what());
    return false;
  }
  return true;
}

} // namespace chunkvault
