// include/cr/sieve.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <gmpxx.h>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace cr {

// Covers every prime below 2^16.
inline constexpr std::uint32_t kDefaultSieveLimit = 65537;

// Shared, immutable list of ascending primes.
using PrimeTable = std::shared_ptr<const std::vector<std::uint32_t>>;

// Sieve of Eratosthenes; all primes p < limit.
std::vector<std::uint32_t> generate_primes_up_to(std::uint32_t limit);

// Tiered small-prime cache keyed by upper bound. A list cached for a larger
// bound may serve a smaller request, unfiltered when the bounds are within
// kReuseSlack of each other. Every member is serialised on one mutex.
class SmallPrimeCache {
public:
  static constexpr std::uint32_t kReuseSlack = 1000;

  PrimeTable get(std::uint32_t limit = kDefaultSieveLimit);
  void clear();

  // Introspection for tests and logs.
  std::size_t generate_calls() const;
  std::size_t filter_calls() const;
  std::vector<std::uint32_t> cached_limits() const;

  // Process-wide instance used when no cache is injected.
  static SmallPrimeCache& global();

private:
  mutable std::mutex mu_;
  std::map<std::uint32_t, PrimeTable> entries_;
  std::size_t generate_calls_ = 0;
  std::size_t filter_calls_ = 0;
};

PrimeTable get_small_primes_for_sieve(std::uint32_t limit = kDefaultSieveLimit,
                                      SmallPrimeCache& cache = SmallPrimeCache::global());

// Wiener's combined sieve for a safe-prime candidate p = 2q + 1: false as
// soon as p or q has a small odd prime factor other than itself.
bool combined_sieve_test(const mpz_class& p,
                         const std::vector<std::uint32_t>& small_primes);

} // namespace cr
