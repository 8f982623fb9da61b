// include/cr/cr.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <future>
#include <gmpxx.h>
#include <string>

#include "ct.hpp"
#include "entropy.hpp"
#include "error.hpp"
#include "modular.hpp"
#include "primality.hpp"
#include "sampler.hpp"
#include "sieve.hpp"

namespace cr {

inline constexpr const char* CR_VERSION = "0.1.0";

// Optional bound on a prime search; zero means unbounded. Exceeding either
// limit throws search_exhausted.
struct SearchBudget {
  std::uint64_t max_attempts = 0;         // candidates sampled
  std::chrono::milliseconds time_limit{0}; // wall clock
};

struct PrimeConfig {
  int bits = 256;                          // exact bit length of the result
  int iterations = 20;                     // Miller-Rabin rounds per test
  bool enhanced = false;                   // FIPS 186-5 C.3.2 variant
  bool safe = false;                       // require (p-1)/2 prime too
  SearchBudget budget{};
  SmallPrimeCache* sieve_cache = nullptr;  // nullptr = SmallPrimeCache::global()
};

struct PrimeResult {
  mpz_class value;
  std::uint64_t attempts = 0;             // candidates sampled, including the hit
  std::uint64_t ns_elapsed = 0;           // wall-clock nanoseconds (best effort)
  std::string engine_info;                // e.g. "gmp:6.2.1; OpenSSL 3.0.2; gcc:12.2.0"
};

// Single entrypoint for prime and safe-prime searches.
// Throws invalid_bit_length if bits < 2 (bits < 3 when safe), invalid_parameter
// if iterations < 1, search_exhausted when the budget runs out.
PrimeResult find_prime(const PrimeConfig& cfg,
                       EntropySource& entropy = system_entropy());

// Validates synchronously, then searches on a worker task.
std::future<PrimeResult> find_prime_async(const PrimeConfig& cfg,
                                          EntropySource& entropy = system_entropy());

mpz_class rand_prime(int bits, int iterations = 20, bool enhanced = false,
                     EntropySource& entropy = system_entropy());
std::future<mpz_class> rand_prime_async(int bits, int iterations = 20,
                                        bool enhanced = false,
                                        EntropySource& entropy = system_entropy());

// p = 2q + 1 with both p and q probable primes and bitlen(p) == bits.
mpz_class rand_safe_prime(int bits, int iterations = 20, bool enhanced = false,
                          EntropySource& entropy = system_entropy());
std::future<mpz_class> rand_safe_prime_async(int bits, int iterations = 20,
                                             bool enhanced = false,
                                             EntropySource& entropy = system_entropy());

// "gmp:<ver>; <openssl ver>; <compiler>"
std::string engine_info();

} // namespace cr
