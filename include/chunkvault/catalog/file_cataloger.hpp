#ifndef CHUNKVAULT_FILE_CATALOGER_HPP
#define CHUNKVAULT_FILE_CATALOGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkvault {

/** Metadata recorded for one unique file content. */
struct CatalogEntry {
  std::string filename;
  uint64_t size{0};
  std::string created;  ///< ISO-8601 local time of the inode change
  std::string modified; ///< ISO-8601 local time of the last write
  std::string contentHash; ///< Hex SHA-256 of the file bytes
  std::string category;
  std::string storedPath; ///< Empty unless the file was organized
};

/** Result of FileCataloger::collectAndOrganize(). */
struct CollectionStats {
  std::map<std::string, size_t> categories; ///< Files per category
  size_t total{0};
  size_t errors{0};
};

/** Filters for FileCataloger::search(). Unset fields match everything. */
struct CatalogQuery {
  std::optional<std::string> nameContains; ///< Case-insensitive
  std::optional<std::string> category;
  std::optional<uint64_t> minSize;
  std::optional<uint64_t> maxSize;
};

nlohmann::json toJson(const CatalogEntry &entry);
nlohmann::json toJson(const CollectionStats &stats);

/**
 * @brief Classifies files by extension and keeps a hash-keyed catalog.
 *
 * Organized copies land in `<basePath>/<category>/`. Catalog entries are keyed
 * by content hash, so ingesting identical bytes twice updates one entry.
 */
class FileCataloger {
public:
  static constexpr const char *OTHER_CATEGORY = "other";

  /// Creates @p basePath and one directory per category.
  explicit FileCataloger(std::string basePath);

  /// Category table in declaration order: (category, extensions).
  static const std::vector<std::pair<std::string, std::vector<std::string>>> &
  categoryTable();

  /// Category of @p path by extension (case-insensitive), "other" if none.
  static std::string categorize(const std::string &path);

  /**
   * @brief Stat and hash one file.
   * @throw std::runtime_error or std::filesystem::filesystem_error on I/O
   *        failure.
   */
  static CatalogEntry extractMetadata(const std::string &path);

  /**
   * @brief Catalog a directory tree (or a single file).
   *
   * With @p autoCategorize each file is copied into its category directory;
   * a name collision appends `_1`, `_2`, ... before the extension. A file
   * or subdirectory that fails is counted in CollectionStats::errors and
   * skipped.
   */
  CollectionStats collectAndOrganize(const std::string &source,
                                     bool autoCategorize = true);

  std::vector<CatalogEntry> search(const CatalogQuery &query) const;

  std::optional<CatalogEntry> entry(const std::string &contentHash) const;
  std::vector<CatalogEntry> entries() const;
  size_t size() const;

  nlohmann::json toJson() const;
  /// Write the catalog as JSON. Returns false on I/O failure.
  bool saveCatalog(const std::string &path) const;

  const std::string &basePath() const { return basePath_; }

private:
  std::string uniqueDestination(const std::string &category,
                                const std::string &filename) const;
  /// Regular files under @p root. Unlistable directories count as errors.
  void gatherFiles(const std::string &root, std::vector<std::string> &files,
                   CollectionStats &stats) const;

  std::string basePath_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CatalogEntry> catalog_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_FILE_CATALOGER_HPP
