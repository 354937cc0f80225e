#ifndef CHUNKVAULT_COMPRESSION_CODEC_HPP
#define CHUNKVAULT_COMPRESSION_CODEC_HPP

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Closed set of supported compression algorithms.
 */
enum class CompressionAlgorithm { ZSTD, ZLIB, BZIP2 };

/// Canonical name: "zstd", "zlib" or "bz2".
std::string algorithmToString(CompressionAlgorithm algo);

/// Parse an algorithm name (case-insensitive, "bzip2" accepted for BZIP2).
std::optional<CompressionAlgorithm>
algorithmFromString(const std::string &name);

/// Every supported algorithm, in declaration order.
const std::vector<CompressionAlgorithm> &supportedAlgorithms();

/**
 * @brief Uniform streaming encode/decode capability.
 *
 * Implementations read from @p in until EOF and write to @p out in bounded
 * windows. Failures throw std::runtime_error.
 */
class StreamCodec {
public:
  virtual ~StreamCodec() = default;

  virtual CompressionAlgorithm algorithm() const = 0;
  virtual int minLevel() const = 0;
  virtual int maxLevel() const = 0;

  virtual void compress(std::istream &in, std::ostream &out, int level) = 0;
  virtual void decompress(std::istream &in, std::ostream &out) = 0;
};

/// Construct the codec implementing @p algo.
std::unique_ptr<StreamCodec> makeStreamCodec(CompressionAlgorithm algo);

/** Outcome of CompressionCodec::compressFile(). */
struct CompressionResult {
  size_t originalSize{0};
  size_t compressedSize{0};
  double compressionRatio{0.0};
  std::string algorithm;
  std::string outputPath;
  std::string error; ///< Empty on success

  bool ok() const { return error.empty(); }
};

/**
 * @brief File-level compression front end.
 *
 * Never throws past its public methods: configuration and I/O problems come
 * back as a CompressionResult with @c error set, or as @c false from
 * decompressFile().
 */
class CompressionCodec {
public:
  static constexpr int DEFAULT_LEVEL = 6;

  explicit CompressionCodec(
      CompressionAlgorithm defaultAlgorithm = CompressionAlgorithm::ZSTD,
      int defaultLevel = DEFAULT_LEVEL);

  /**
   * @brief Compress @p inputPath into @p outputPath.
   * @param outputPath Destination; empty selects `inputPath + ".compressed"`.
   * @param algorithm Codec to use; defaults to the configured algorithm.
   * @param level Codec level; defaults to the configured level.
   */
  CompressionResult compressFile(const std::string &inputPath,
                                 const std::string &outputPath = "",
                                 std::optional<CompressionAlgorithm> algorithm =
                                     std::nullopt,
                                 std::optional<int> level = std::nullopt) const;

  /// Same as above with the algorithm given by name. Unknown names fail.
  CompressionResult compressFile(const std::string &inputPath,
                                 const std::string &outputPath,
                                 const std::string &algorithmName,
                                 std::optional<int> level = std::nullopt) const;

  /**
   * @brief Decompress @p inputPath into @p outputPath.
   *
   * A failed decode leaves no output file behind.
   */
  bool decompressFile(const std::string &inputPath,
                      const std::string &outputPath,
                      std::optional<CompressionAlgorithm> algorithm =
                          std::nullopt) const;

  CompressionAlgorithm defaultAlgorithm() const { return defaultAlgorithm_; }
  int defaultLevel() const { return defaultLevel_; }

private:
  CompressionAlgorithm defaultAlgorithm_;
  int defaultLevel_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_COMPRESSION_CODEC_HPP
