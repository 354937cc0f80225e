#ifndef CHUNKVAULT_CHUNK_STORE_HPP
#define CHUNKVAULT_CHUNK_STORE_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkvault {

/// Default chunk window in bytes.
inline constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

/** Outcome of ChunkStore::deduplicateFile(). */
struct DedupResult {
  std::string filePath;
  size_t totalChunks{0};
  size_t newChunks{0};
  size_t duplicateChunks{0};
  size_t totalSize{0};
  size_t savedSize{0};
  double dedupRatio{0.0};
  std::vector<std::string> chunkDigests; ///< Ordered digests of this version
  std::string error;                     ///< Empty on success

  bool ok() const { return error.empty(); }
};

/**
 * @brief Content-addressed store of fixed-size file chunks.
 *
 * Chunks are keyed by the hex SHA-256 of their bytes and written once to
 * `<storeDir>/chunks/<digest>`. The digest map is shared by every file this
 * instance processes, so identical chunks from different files are stored a
 * single time. Nothing is ever deleted from the store.
 *
 * All public methods are thread-safe.
 */
class ChunkStore {
public:
  using Chunk = std::pair<std::string, std::vector<std::byte>>;
  using ChunkVisitor =
      std::function<void(const std::string &digest, const std::byte *data,
                         size_t size)>;

  struct Stats {
    size_t totalChunks{0};
    size_t totalFiles{0};
    size_t chunkSize{0};
  };

  /**
   * @param chunkSize Window size used to split files.
   * @throw std::invalid_argument if @p chunkSize is zero.
   */
  explicit ChunkStore(size_t chunkSize = DEFAULT_CHUNK_SIZE);

  /**
   * @brief Stream a file in chunk-sized windows.
   *
   * Only one window is held in memory at a time. The last window may be
   * shorter than the chunk size.
   *
   * @return False if the file cannot be opened or a read fails.
   */
  bool forEachChunk(const std::string &path, const ChunkVisitor &visit,
                    std::string *errorOut = nullptr) const;

  /**
   * @brief Split a file into (digest, bytes) pairs.
   * @return The ordered chunk list, or an empty list if the file is
   *         unreadable.
   */
  std::vector<Chunk> chunkFile(const std::string &path) const;

  /**
   * @brief Persist the unique chunks of a file and record its chunk index.
   *
   * The index entry is keyed by @p path as given and replaces any previous
   * entry for the same key. On failure the result carries an error and the
   * index is left untouched.
   */
  DedupResult deduplicateFile(const std::string &path,
                              const std::string &storeDir);

  /**
   * @brief Rebuild a previously deduplicated file.
   *
   * Output is assembled in a temporary file beside @p outputPath and renamed
   * into place only once every chunk was copied.
   *
   * @return False if @p fileKey is unknown or any chunk is missing.
   */
  bool reconstructFile(const std::string &fileKey,
                       const std::string &outputPath) const;

  /**
   * @brief Rebuild a file from an explicit ordered digest list.
   *
   * When @p expectedSha256 is non-empty the assembled output must hash to it
   * or nothing is written to @p outputPath.
   *
   * @return False if any chunk is missing, corrupt or the whole-file digest
   *         does not match.
   */
  bool reconstructChunks(const std::vector<std::string> &digests,
                         const std::string &outputPath,
                         const std::string &expectedSha256 = "") const;

  bool hasChunk(const std::string &digest) const;

  /** Ordered chunk digests recorded for @p fileKey. */
  std::optional<std::vector<std::string>>
  fileIndex(const std::string &fileKey) const;

  Stats stats() const;

  size_t chunkSize() const { return chunkSize_; }

private:
  size_t chunkSize_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> chunkPaths_; // digest -> path
  std::unordered_map<std::string, std::vector<std::string>> fileChunks_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_STORE_HPP
