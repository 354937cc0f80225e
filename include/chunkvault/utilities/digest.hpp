#ifndef CHUNKVAULT_DIGEST_HPP
#define CHUNKVAULT_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <string>

namespace chunkvault {

/// SHA-256 digest size (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// Read window used when hashing whole files.
inline constexpr size_t HASH_READ_WINDOW = 64 * 1024;

/**
 * @brief Initialize libsodium once per process.
 * @throw std::runtime_error if libsodium cannot be initialized.
 */
void ensureSodiumInitialized();

/**
 * @brief Incremental SHA-256 backed by libsodium.
 */
class Sha256Hasher {
public:
  Sha256Hasher();

  // Appends data to the running digest.
  void update(const std::byte *data, size_t size);

  /**
   * @brief Finalize and return the digest.
   * @throw std::logic_error if called twice or after update() on a finalized
   *        hasher.
   */
  DigestArray finalize();

  std::string finalizeHex();

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

/// Lowercase hex encoding of a digest.
std::string toHex(const DigestArray &digest);

/// One-shot SHA-256 of a buffer, hex encoded.
std::string sha256Hex(const std::byte *data, size_t size);

/**
 * @brief Stream a file through SHA-256.
 * @return Lowercase hex digest.
 * @throw std::runtime_error if the file cannot be opened or read.
 */
std::string sha256File(const std::string &path);

} // namespace chunkvault

#endif // CHUNKVAULT_DIGEST_HPP
