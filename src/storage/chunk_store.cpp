#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/utilities/digest.hpp"
#include "chunkvault/utilities/logger.h"
#include "chunkvault/utilities/metrics.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

bool writeChunkFile(const fs::path &path, const std::byte *data, size_t size) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(reinterpret_cast<const char *>(data),
            static_cast<std::streamsize>(size));
  out.flush();
  return static_cast<bool>(out);
}

} // namespace

ChunkStore::ChunkStore(size_t chunkSize) : chunkSize_(chunkSize) {
  if (chunkSize_ == 0) {
    throw std::invalid_argument("Chunk size must be greater than zero");
  }
}

bool ChunkStore::forEachChunk(const std::string &path,
                              const ChunkVisitor &visit,
                              std::string *errorOut) const {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (errorOut)
      *errorOut = "Cannot open file: " + path;
    return false;
  }

  std::vector<std::byte> window(chunkSize_);
  while (in) {
    in.read(reinterpret_cast<char *>(window.data()),
            static_cast<std::streamsize>(window.size()));
    std::streamsize got = in.gcount();
    if (got <= 0) {
      break;
    }
    const auto size = static_cast<size_t>(got);
    visit(sha256Hex(window.data(), size), window.data(), size);
  }
  if (in.bad()) {
    if (errorOut)
      *errorOut = "Read error while chunking: " + path;
    return false;
  }
  return true;
}

std::vector<ChunkStore::Chunk>
ChunkStore::chunkFile(const std::string &path) const {
  std::vector<Chunk> chunks;
  std::string error;
  bool ok = forEachChunk(
      path,
      [&chunks](const std::string &digest, const std::byte *data,
                size_t size) {
        chunks.emplace_back(digest, std::vector<std::byte>(data, data + size));
      },
      &error);
  if (!ok) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Error chunking file " + path + ": " + error);
    return {};
  }
  return chunks;
}

DedupResult ChunkStore::deduplicateFile(const std::string &path,
                                        const std::string &storeDir) {
  DedupResult result;
  result.filePath = path;

  const fs::path chunkDir = fs::path(storeDir) / "chunks";
  std::error_code ec;
  fs::create_directories(chunkDir, ec);
  if (ec) {
    result.error = "Cannot create chunk directory " + chunkDir.string() +
                   ": " + ec.message();
    Logger::getInstance().log(LogLevel::ERROR, result.error);
    return result;
  }

  std::vector<std::string> digests;
  std::string writeError;
  std::string readError;

  bool readOk = forEachChunk(
      path,
      [&](const std::string &digest, const std::byte *data, size_t size) {
        if (!writeError.empty()) {
          return;
        }
        digests.push_back(digest);
        result.totalSize += size;

        // The lookup and the write share one critical section so two
        // concurrent files cannot both claim the same new digest.
        std::lock_guard<std::mutex> lock(mutex_);
        if (chunkPaths_.count(digest) > 0) {
          result.duplicateChunks++;
          result.savedSize += size;
          return;
        }
        const fs::path chunkPath = chunkDir / digest;
        if (!writeChunkFile(chunkPath, data, size)) {
          writeError = "Failed to write chunk " + chunkPath.string();
          return;
        }
        chunkPaths_.emplace(digest, chunkPath.string());
        result.newChunks++;
      },
      &readError);

  if (!readOk || !writeError.empty()) {
    result.error = !writeError.empty() ? writeError : readError;
    Logger::getInstance().log(LogLevel::ERROR, "Deduplication of " + path +
                                                   " failed: " + result.error);
    return result;
  }

  result.totalChunks = digests.size();
  result.dedupRatio =
      result.totalSize > 0
          ? static_cast<double>(result.savedSize) / result.totalSize
          : 0.0;

  result.chunkDigests = digests;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fileChunks_[path] = std::move(digests);
  }

  auto &metrics = MetricsRegistry::instance();
  metrics.incrementCounter("chunkvault_chunks_new_total",
                           static_cast<double>(result.newChunks));
  metrics.incrementCounter("chunkvault_chunks_duplicate_total",
                           static_cast<double>(result.duplicateChunks));
  metrics.incrementCounter("chunkvault_dedup_saved_bytes_total",
                           static_cast<double>(result.savedSize));

  Logger::getInstance().log(
      LogLevel::DEBUG, "Deduplicated " + path + ": " +
                           std::to_string(result.newChunks) + " new, " +
                           std::to_string(result.duplicateChunks) +
                           " duplicate chunks");
  return result;
}

bool ChunkStore::reconstructFile(const std::string &fileKey,
                                 const std::string &outputPath) const {
  auto digests = fileIndex(fileKey);
  if (!digests) {
    return false;
  }
  return reconstructChunks(*digests, outputPath);
}

bool ChunkStore::reconstructChunks(const std::vector<std::string> &digests,
                                   const std::string &outputPath,
                                   const std::string &expectedSha256) const {
  std::vector<std::pair<std::string, std::string>> plan; // digest, chunk path
  {
    std::lock_guard<std::mutex> lock(mutex_);
    plan.reserve(digests.size());
    for (const auto &digest : digests) {
      auto pathIt = chunkPaths_.find(digest);
      if (pathIt == chunkPaths_.end()) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Chunk " + digest + " is not in the store");
        return false;
      }
      plan.emplace_back(digest, pathIt->second);
    }
  }

  const std::string tempPath = outputPath + ".partial";
  Sha256Hasher whole;
  bool ok = true;
  {
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Cannot open reconstruction output " +
                                    tempPath);
      return false;
    }
    std::vector<char> buffer(chunkSize_);
    for (const auto &[digest, chunkPath] : plan) {
      std::ifstream in(chunkPath, std::ios::binary);
      if (!in) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Missing chunk " + digest + " at " +
                                      chunkPath);
        ok = false;
        break;
      }
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      if (in.bad()) {
        ok = false;
        break;
      }
      const auto got = static_cast<size_t>(in.gcount());
      const auto *bytes = reinterpret_cast<const std::byte *>(buffer.data());
      if (sha256Hex(bytes, got) != digest) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Chunk " + digest + " at " + chunkPath +
                                      " failed digest verification");
        ok = false;
        break;
      }
      whole.update(bytes, got);
      out.write(buffer.data(), static_cast<std::streamsize>(got));
    }
    out.flush();
    if (!out) {
      ok = false;
    }
  }

  if (ok && !expectedSha256.empty()) {
    const std::string actual = whole.finalizeHex();
    if (actual != expectedSha256) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Reconstructed " + outputPath + " hashes to " +
                                    actual + ", expected " + expectedSha256);
      ok = false;
    }
  }

  std::error_code ec;
  if (ok) {
    fs::rename(tempPath, outputPath, ec);
    if (ec) {
      Logger::getInstance().log(LogLevel::ERROR, "Cannot move " + tempPath +
                                                     " to " + outputPath +
                                                     ": " + ec.message());
      ok = false;
    }
  }
  if (!ok) {
    fs::remove(tempPath, ec);
  }
  return ok;
}

bool ChunkStore::hasChunk(const std::string &digest) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunkPaths_.count(digest) > 0;
}

std::optional<std::vector<std::string>>
ChunkStore::fileIndex(const std::string &fileKey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = fileChunks_.find(fileKey);
  if (it == fileChunks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ChunkStore::Stats ChunkStore::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats s;
  s.totalChunks = chunkPaths_.size();
  s.totalFiles = fileChunks_.size();
  s.chunkSize = chunkSize_;
  return s;
}

} // namespace chunkvault
