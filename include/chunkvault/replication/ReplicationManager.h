#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkvault {

/** Replica health derived from the number of live copies. */
enum class ReplicaHealth { GOOD, DEGRADED, FAILED };

std::string healthToString(ReplicaHealth health);

/// good when at least two copies are live, degraded with one, failed with none.
ReplicaHealth classifyHealth(size_t available);

/** Outcome of ReplicationManager::store(). */
struct ReplicationResult {
  std::string contentId;
  std::vector<std::string> storedLocations;
  /// (configured location, failure message) for each copy that failed.
  std::vector<std::pair<std::string, std::string>> failedLocations;
  size_t replicationAchieved{0};
  std::string error; ///< Set only when no copy could be attempted

  bool ok() const { return error.empty(); }
};

/** Outcome of ReplicationManager::verify(). */
struct ReplicaStatus {
  std::string contentId;
  size_t available{0};
  size_t missing{0};
  /// Remote copies counted as available without any reachability check.
  size_t unverifiedRemote{0};
  ReplicaHealth health{ReplicaHealth::FAILED};
};

/**
 * @brief Copies blobs to a fixed list of storage locations.
 *
 * The first @c replicationFactor configured locations receive a copy named by
 * the content id. Local locations are directories; locations starting with
 * http://, https:// or s3:// are remote endpoints that are recorded but never
 * contacted, and verify() counts them as available.
 */
class ReplicationManager {
public:
  /**
   * @param locations Ordered storage locations.
   * @param replicationFactor Number of copies to attempt.
   * @throw std::invalid_argument if @p replicationFactor is zero.
   */
  ReplicationManager(std::vector<std::string> locations,
                     size_t replicationFactor = 2);

  static bool isRemoteLocation(const std::string &location);

  /**
   * @brief Replicate a file.
   * @param filePath Blob to copy.
   * @param contentId Identifier; defaults to the SHA-256 of the file.
   * @return Partial replication is reported through failedLocations, not as
   *         an error.
   */
  ReplicationResult store(const std::string &filePath,
                          std::optional<std::string> contentId = std::nullopt);

  /**
   * @brief Copy the first reachable local replica to @p outputPath.
   * @return False if the id is unknown or every local copy fails.
   */
  bool retrieve(const std::string &contentId,
                const std::string &outputPath) const;

  /**
   * @brief Count live and missing replicas for @p contentId.
   *
   * Local copies are checked on disk. Remote copies are not probed; they are
   * counted as available and reported in ReplicaStatus::unverifiedRemote.
   */
  ReplicaStatus verify(const std::string &contentId) const;

  /**
   * @brief Verify every known content id and publish replication gauges.
   * @return Number of content ids whose health is not good.
   */
  size_t verifyAll() const;

  /** Recorded replica locations for @p contentId (empty if unknown). */
  std::vector<std::string> locationsFor(const std::string &contentId) const;

  const std::vector<std::string> &locations() const { return locations_; }
  size_t replicationFactor() const { return replicationFactor_; }

private:
  std::vector<std::string> locations_;
  size_t replicationFactor_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::string>> fileLocations_;
};

} // namespace chunkvault
