#include "chunkvault/replication/ReplicationManager.h"
#include "chunkvault/utilities/digest.hpp"
#include "chunkvault/utilities/logger.h"
#include "chunkvault/utilities/metrics.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkvault {

std::string healthToString(ReplicaHealth health) {
  switch (health) {
  case ReplicaHealth::GOOD:
    return "good";
  case ReplicaHealth::DEGRADED:
    return "degraded";
  case ReplicaHealth::FAILED:
    return "failed";
  }
  return "unknown";
}

ReplicaHealth classifyHealth(size_t available) {
  if (available >= 2)
    return ReplicaHealth::GOOD;
  if (available == 1)
    return ReplicaHealth::DEGRADED;
  return ReplicaHealth::FAILED;
}

ReplicationManager::ReplicationManager(std::vector<std::string> locations,
                                       size_t replicationFactor)
    : locations_(std::move(locations)), replicationFactor_(replicationFactor) {
  if (replicationFactor_ == 0) {
    throw std::invalid_argument("Replication factor must be at least 1");
  }
  for (const auto &location : locations_) {
    if (isRemoteLocation(location))
      continue;
    std::error_code ec;
    fs::create_directories(location, ec);
    if (ec) {
      // store() reports the copy failure for this location later.
      Logger::getInstance().log(LogLevel::WARN,
                                "Cannot create storage location " + location +
                                    ": " + ec.message());
    }
  }
}

bool ReplicationManager::isRemoteLocation(const std::string &location) {
  return location.rfind("http://", 0) == 0 ||
         location.rfind("https://", 0) == 0 || location.rfind("s3://", 0) == 0;
}

ReplicationResult
ReplicationManager::store(const std::string &filePath,
                          std::optional<std::string> contentId) {
  ReplicationResult result;
  if (contentId && !contentId->empty()) {
    result.contentId = *contentId;
  } else {
    try {
      result.contentId = sha256File(filePath);
    } catch (const std::exception &e) {
      result.error = e.what();
      Logger::getInstance().log(LogLevel::ERROR,
                                "Replication of " + filePath +
                                    " aborted: " + result.error);
      return result;
    }
  }

  const size_t targets = std::min(replicationFactor_, locations_.size());
  for (size_t i = 0; i < targets; ++i) {
    const std::string &location = locations_[i];
    if (isRemoteLocation(location)) {
      result.storedLocations.push_back(location + "/" + result.contentId);
      continue;
    }
    const fs::path dest = fs::path(location) / result.contentId;
    std::error_code ec;
    fs::copy_file(filePath, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      result.failedLocations.emplace_back(location, ec.message());
      MetricsRegistry::instance().incrementCounter(
          "chunkvault_replication_failures_total", 1.0,
          {{"location", location}});
      Logger::getInstance().log(LogLevel::WARN, "Replica copy of " + filePath +
                                                    " to " + dest.string() +
                                                    " failed: " +
                                                    ec.message());
      continue;
    }
    result.storedLocations.push_back(dest.string());
  }
  result.replicationAchieved = result.storedLocations.size();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    fileLocations_[result.contentId] = result.storedLocations;
  }

  Logger::getInstance().log(
      LogLevel::INFO, "Replicated " + result.contentId + " to " +
                          std::to_string(result.replicationAchieved) + "/" +
                          std::to_string(targets) + " locations");
  return result;
}

std::vector<std::string>
ReplicationManager::locationsFor(const std::string &contentId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = fileLocations_.find(contentId);
  if (it == fileLocations_.end()) {
    return {};
  }
  return it->second;
}

bool ReplicationManager::retrieve(const std::string &contentId,
                                  const std::string &outputPath) const {
  std::vector<std::string> copies;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fileLocations_.find(contentId);
    if (it == fileLocations_.end()) {
      return false;
    }
    copies = it->second;
  }

  for (const auto &copy : copies) {
    // Remote copies would need a download; nothing to fetch here.
    if (isRemoteLocation(copy))
      continue;
    std::error_code ec;
    if (!fs::exists(copy, ec))
      continue;
    fs::copy_file(copy, outputPath, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
      return true;
    }
    Logger::getInstance().log(LogLevel::WARN, "Failed to retrieve from " +
                                                  copy + ": " + ec.message());
  }
  return false;
}

ReplicaStatus ReplicationManager::verify(const std::string &contentId) const {
  ReplicaStatus status;
  status.contentId = contentId;

  std::vector<std::string> copies;
  bool known = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fileLocations_.find(contentId);
    if (it != fileLocations_.end()) {
      known = true;
      copies = it->second;
    }
  }
  if (!known) {
    status.missing = replicationFactor_;
    status.health = ReplicaHealth::FAILED;
    return status;
  }

  for (const auto &copy : copies) {
    if (isRemoteLocation(copy)) {
      status.available++;
      status.unverifiedRemote++;
      continue;
    }
    std::error_code ec;
    if (fs::exists(copy, ec)) {
      status.available++;
    } else {
      status.missing++;
    }
  }
  status.health = classifyHealth(status.available);
  return status;
}

size_t ReplicationManager::verifyAll() const {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(fileLocations_.size());
    for (const auto &kv : fileLocations_) {
      ids.push_back(kv.first);
    }
  }
  size_t pending = 0;
  for (const auto &id : ids) {
    if (verify(id).health != ReplicaHealth::GOOD)
      ++pending;
  }
  auto &metrics = MetricsRegistry::instance();
  metrics.setGauge("chunkvault_replication_pending",
                   static_cast<double>(pending));
  metrics.setGauge("chunkvault_replicas_healthy",
                   static_cast<double>(ids.size() - pending));
  return pending;
}

} // namespace chunkvault
