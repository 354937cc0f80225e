#include "chunkvault/utilities/digest.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

namespace chunkvault {

void ensureSodiumInitialized() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Sha256Hasher::Sha256Hasher() {
  ensureSodiumInitialized();
  crypto_hash_sha256_init(&state_);
}

void Sha256Hasher::update(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update a finalized SHA-256 hasher.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

DigestArray Sha256Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("SHA-256 hasher already finalized.");
  }
  DigestArray digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finalized_ = true;
  return digest;
}

std::string Sha256Hasher::finalizeHex() { return toHex(finalize()); }

std::string toHex(const DigestArray &digest) {
  // sodium_bin2hex writes 2*N chars plus the terminator.
  char hex[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, DIGEST_SIZE * 2);
}

std::string sha256Hex(const std::byte *data, size_t size) {
  Sha256Hasher hasher;
  hasher.update(data, size);
  return hasher.finalizeHex();
}

std::string sha256File(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open file for hashing: " + path);
  }
  Sha256Hasher hasher;
  std::vector<std::byte> window(HASH_READ_WINDOW);
  while (in) {
    in.read(reinterpret_cast<char *>(window.data()),
            static_cast<std::streamsize>(window.size()));
    std::streamsize got = in.gcount();
    if (got > 0) {
      hasher.update(window.data(), static_cast<size_t>(got));
    }
  }
  if (in.bad()) {
    throw std::runtime_error("Read error while hashing: " + path);
  }
  return hasher.finalizeHex();
}

} // namespace chunkvault
