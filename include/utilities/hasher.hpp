#ifndef MERKLECLAIM_HASHER_HPP
#define MERKLECLAIM_HASHER_HPP

#include "utilities/digest.hpp"

#include <cstddef>
#include <sodium.h>

namespace merkleclaim {

/**
 * @brief Streaming SHA-256 over libsodium.
 *
 * Data is fed with ingest() and the digest produced once by finalize().
 * The hasher cannot be reused after finalize().
 */
class Hasher {
public:
  /**
   * @throw std::runtime_error If libsodium cannot be initialized.
   */
  Hasher();

  // Appends data to the running hash.
  void ingest(const uint8_t *data, size_t size);

  void ingestByte(uint8_t value) { ingest(&value, 1); }

  template <size_t N> void ingest(const std::array<uint8_t, N> &bytes) {
    ingest(bytes.data(), N);
  }

  /**
   * @brief Finalize the hash.
   * @throw std::logic_error If finalize() was already called.
   */
  Digest finalize();

  /** One-shot SHA-256 of a buffer. */
  static Digest sha256(const uint8_t *data, size_t size);

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_HASHER_HPP
