#include "utilities/hasher.hpp"

#include <stdexcept>

namespace merkleclaim {

Hasher::Hasher() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&state_);
}

void Hasher::ingest(const uint8_t *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(&state_, data, size);
  }
}

Digest Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  Digest out{};
  crypto_hash_sha256_final(&state_, out.data());
  finalized_ = true;
  return out;
}

Digest Hasher::sha256(const uint8_t *data, size_t size) {
  Hasher h;
  h.ingest(data, size);
  return h.finalize();
}

} // namespace merkleclaim
