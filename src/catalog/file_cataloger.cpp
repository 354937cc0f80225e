#include "chunkvault/catalog/file_cataloger.hpp"
#include "chunkvault/utilities/digest.hpp"
#include "chunkvault/utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string isoLocalTime(std::time_t t) {
  std::tm local{};
  localtime_r(&t, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
  return buf;
}

} // namespace

nlohmann::json toJson(const CatalogEntry &entry) {
  nlohmann::json j;
  j["filename"] = entry.filename;
  j["size"] = entry.size;
  j["created"] = entry.created;
  j["modified"] = entry.modified;
  j["sha256"] = entry.contentHash;
  j["category"] = entry.category;
  if (!entry.storedPath.empty())
    j["stored_path"] = entry.storedPath;
  return j;
}

nlohmann::json toJson(const CollectionStats &stats) {
  nlohmann::json j;
  for (const auto &[category, count] : stats.categories) {
    j[category] = count;
  }
  j["total"] = stats.total;
  j["errors"] = stats.errors;
  return j;
}

FileCataloger::FileCataloger(std::string basePath)
    : basePath_(std::move(basePath)) {
  for (const auto &[category, extensions] : categoryTable()) {
    std::error_code ec;
    fs::create_directories(fs::path(basePath_) / category, ec);
    if (ec) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Cannot create category directory " +
                                    category + ": " + ec.message());
    }
  }
}

const std::vector<std::pair<std::string, std::vector<std::string>>> &
FileCataloger::categoryTable() {
  static const std::vector<std::pair<std::string, std::vector<std::string>>>
      table = {
          {"documents", {".pdf", ".doc", ".docx", ".txt", ".md"}},
          {"images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff"}},
          {"videos", {".mp4", ".avi", ".mkv", ".mov", ".wmv"}},
          {"audio", {".mp3", ".wav", ".flac", ".ogg", ".m4a"}},
          {"archives", {".zip", ".tar", ".gz", ".7z", ".rar"}},
          {"data", {".json", ".xml", ".csv", ".xlsx", ".db"}},
          {"code", {".py", ".js", ".java", ".cpp", ".c", ".h"}},
      };
  return table;
}

std::string FileCataloger::categorize(const std::string &path) {
  const std::string ext = toLower(fs::path(path).extension().string());
  if (ext.empty())
    return OTHER_CATEGORY;
  for (const auto &[category, extensions] : categoryTable()) {
    if (std::find(extensions.begin(), extensions.end(), ext) !=
        extensions.end()) {
      return category;
    }
  }
  return OTHER_CATEGORY;
}

CatalogEntry FileCataloger::extractMetadata(const std::string &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    throw std::runtime_error("Cannot stat " + path + ": " +
                             std::strerror(errno));
  }
  if (!S_ISREG(st.st_mode)) {
    throw std::runtime_error("Not a regular file: " + path);
  }

  CatalogEntry entry;
  entry.filename = fs::path(path).filename().string();
  entry.size = static_cast<uint64_t>(st.st_size);
  entry.created = isoLocalTime(st.st_ctime);
  entry.modified = isoLocalTime(st.st_mtime);
  entry.contentHash = sha256File(path);
  entry.category = categorize(path);
  return entry;
}

std::string FileCataloger::uniqueDestination(const std::string &category,
                                             const std::string &filename) const {
  const fs::path dir = fs::path(basePath_) / category;
  fs::path dest = dir / filename;
  const std::string stem = fs::path(filename).stem().string();
  const std::string ext = fs::path(filename).extension().string();
  std::error_code ec;
  for (int counter = 1; fs::exists(dest, ec); ++counter) {
    dest = dir / (stem + "_" + std::to_string(counter) + ext);
  }
  return dest.string();
}

void FileCataloger::gatherFiles(const std::string &root,
                                std::vector<std::string> &files,
                                CollectionStats &stats) const {
  // Explicit stack so an unreadable directory only drops its own subtree.
  std::vector<fs::path> pending{fs::path(root)};
  while (!pending.empty()) {
    const fs::path dir = pending.back();
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      std::error_code typeEc;
      if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) {
        pending.push_back(it->path());
      } else if (it->is_regular_file(typeEc)) {
        files.push_back(it->path().string());
      }
    }
    if (ec) {
      stats.errors++;
      Logger::getInstance().log(LogLevel::WARN, "Cannot list " + dir.string() +
                                                    ": " + ec.message());
    }
  }
}

CollectionStats FileCataloger::collectAndOrganize(const std::string &source,
                                                  bool autoCategorize) {
  CollectionStats stats;
  std::vector<std::string> files;

  std::error_code ec;
  if (fs::is_regular_file(source, ec)) {
    files.push_back(source);
  } else if (fs::is_directory(source, ec)) {
    gatherFiles(source, files, stats);
  } else {
    stats.errors++;
    Logger::getInstance().log(LogLevel::ERROR,
                              "Collection source not found: " + source);
    return stats;
  }

  for (const auto &file : files) {
    try {
      CatalogEntry entry = extractMetadata(file);
      if (autoCategorize) {
        const std::string dest = uniqueDestination(entry.category,
                                                   entry.filename);
        fs::copy_file(file, dest, fs::copy_options::none);
        entry.storedPath = dest;
      }
      const std::string category = entry.category;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_[entry.contentHash] = std::move(entry);
      }
      stats.categories[category]++;
      stats.total++;
    } catch (const std::exception &e) {
      stats.errors++;
      Logger::getInstance().log(LogLevel::WARN, "Error processing " + file +
                                                    ": " + e.what());
    }
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Collected " + std::to_string(stats.total) +
                                " files from " + source + " (" +
                                std::to_string(stats.errors) + " errors)");
  return stats;
}

std::vector<CatalogEntry>
FileCataloger::search(const CatalogQuery &query) const {
  const std::string needle =
      query.nameContains ? toLower(*query.nameContains) : std::string();
  std::vector<CatalogEntry> results;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &kv : catalog_) {
    const CatalogEntry &e = kv.second;
    if (query.category && e.category != *query.category)
      continue;
    if (query.minSize && e.size < *query.minSize)
      continue;
    if (query.maxSize && e.size > *query.maxSize)
      continue;
    if (query.nameContains &&
        toLower(e.filename).find(needle) == std::string::npos)
      continue;
    results.push_back(e);
  }
  std::sort(results.begin(), results.end(),
            [](const CatalogEntry &a, const CatalogEntry &b) {
              return a.filename < b.filename;
            });
  return results;
}

std::optional<CatalogEntry>
FileCataloger::entry(const std::string &contentHash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = catalog_.find(contentHash);
  if (it == catalog_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<CatalogEntry> FileCataloger::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CatalogEntry> all;
  all.reserve(catalog_.size());
  for (const auto &kv : catalog_) {
    all.push_back(kv.second);
  }
  return all;
}

size_t FileCataloger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return catalog_.size();
}

nlohmann::json FileCataloger::toJson() const {
  nlohmann::json j = nlohmann::json::object();
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[hash, e] : catalog_) {
    j[hash] = chunkvault::toJson(e);
  }
  return j;
}

bool FileCataloger::saveCatalog(const std::string &path) const {
  const std::string tempPath = path + ".tmp";
  {
    std::ofstream out(tempPath, std::ios::trunc);
    if (!out) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Cannot write catalog to " + tempPath);
      return false;
    }
    out << toJson().dump(2) << '\n';
    if (!out) {
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tempPath, path, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR, "Cannot move catalog to " +
                                                   path + ": " + ec.message());
    fs::remove(tempPath, ec);
    return false;
  }
  return true;
}

} // namespace chunkvault
