// include/cr/entropy.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <future>
#include <vector>

namespace cr {

using Bytes = std::vector<std::uint8_t>;

// Source of cryptographically secure bytes; the only non-determinism in the
// library. Both forms must be interchangeable at any call site.
class EntropySource {
public:
  virtual ~EntropySource() = default;

  // Blocking: exactly n bytes or throws entropy_unavailable.
  virtual Bytes get_bytes(std::size_t n) = 0;

  // Suspending: default is a deferred call of get_bytes().
  virtual std::future<Bytes> get_bytes_async(std::size_t n);
};

// OpenSSL RAND_bytes backed source.
class SystemEntropy final : public EntropySource {
public:
  Bytes get_bytes(std::size_t n) override;
};

// Process-wide SystemEntropy instance.
EntropySource& system_entropy();

} // namespace cr
