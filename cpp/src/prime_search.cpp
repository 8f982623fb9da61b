// src/prime_search.cpp
#include "cr/cr.hpp"
#include "cr/log.hpp"
#include "detail/miller_rabin.hpp"

#include <chrono>
#include <cstdint>
#include <gmp.h>
#include <openssl/crypto.h>
#include <string>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}

using clock_type = std::chrono::steady_clock;
} // namespace

namespace cr {
namespace {

void validate(const PrimeConfig &cfg) {
  const int min_bits = cfg.safe ? 3 : 2;
  if (cfg.bits < min_bits)
    throw invalid_bit_length(
        cfg.safe ? "safe prime bit length must be an integer >= 3"
                 : "bit length must be an integer greater than or equal to 2");
  if (cfg.iterations < 1)
    throw invalid_parameter("number of iterations must be a positive integer");
}

// Called before every new candidate.
void check_budget(const SearchBudget &b, std::uint64_t attempts,
                  clock_type::time_point t0) {
  if (b.max_attempts != 0 && attempts >= b.max_attempts) {
    CR_LOG_WARN("prime search gave up after {} attempts", attempts);
    throw search_exhausted("no prime found within " +
                           std::to_string(b.max_attempts) + " attempts");
  }
  if (b.time_limit.count() > 0 && clock_type::now() - t0 >= b.time_limit) {
    CR_LOG_WARN("prime search gave up after {} ms and {} attempts",
                b.time_limit.count(), attempts);
    throw search_exhausted("no prime found within " +
                           std::to_string(b.time_limit.count()) + " ms");
  }
}

template <class Fetch>
mpz_class search_prime(const PrimeConfig &cfg, Fetch &fetch,
                       std::uint64_t &attempts, clock_type::time_point t0) {
  for (;;) {
    check_budget(cfg.budget, attempts, t0);
    ++attempts;
    mpz_class candidate = detail::sample_big_int(cfg.bits, fetch);
    if (detail::probable_prime(candidate, cfg.iterations, fetch, cfg.enhanced))
      return candidate;
  }
}

template <class Fetch>
mpz_class search_safe_prime(const PrimeConfig &cfg, Fetch &fetch,
                            std::uint64_t &attempts, clock_type::time_point t0) {
  SmallPrimeCache &cache =
      cfg.sieve_cache ? *cfg.sieve_cache : SmallPrimeCache::global();
  const std::size_t want_bits = static_cast<std::size_t>(cfg.bits);

  for (;;) {
    check_budget(cfg.budget, attempts, t0);
    ++attempts;

    const PrimeTable small_primes = cache.get(kDefaultSieveLimit);
    mpz_class p = detail::sample_big_int(cfg.bits, fetch);
    const mpz_class q = (p - 1) / 2;

    if (mpz_even_p(p.get_mpz_t()) || (mpz_even_p(q.get_mpz_t()) && q > 1))
      continue;
    if (!combined_sieve_test(p, *small_primes)) {
      CR_LOG_TRACE("safe prime attempt {} rejected by sieve", attempts);
      continue;
    }
    // q first: it fails more cheaply and carries no parity constraint.
    if (!detail::probable_prime(q, cfg.iterations, fetch, cfg.enhanced))
      continue;
    if (!detail::probable_prime(p, cfg.iterations, fetch, cfg.enhanced))
      continue;
    // The sampler may leave bits set above bits-1.
    if (mpz_sizeinbase(p.get_mpz_t(), 2) != want_bits) {
      CR_LOG_TRACE("safe prime candidate has {} bits, want {}",
                   mpz_sizeinbase(p.get_mpz_t(), 2), want_bits);
      continue;
    }
    return p;
  }
}

template <class Fetch>
PrimeResult run_search(const PrimeConfig &cfg, Fetch &fetch) {
  PrimeResult out;
  auto t0 = clock_type::now();

  out.value = cfg.safe ? search_safe_prime(cfg, fetch, out.attempts, t0)
                       : search_prime(cfg, fetch, out.attempts, t0);

  auto t1 = clock_type::now();
  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
  out.engine_info = engine_info();

  CR_LOG_DEBUG("{} search: {} bits, {} rounds{}, {} attempts, {} ns",
               cfg.safe ? "safe-prime" : "prime", cfg.bits, cfg.iterations,
               cfg.enhanced ? " (fips)" : "", out.attempts, out.ns_elapsed);
  return out;
}

PrimeConfig make_config(int bits, int iterations, bool enhanced, bool safe) {
  PrimeConfig cfg;
  cfg.bits = bits;
  cfg.iterations = iterations;
  cfg.enhanced = enhanced;
  cfg.safe = safe;
  return cfg;
}

} // namespace

std::string engine_info() {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         OpenSSL_version(OPENSSL_VERSION) + "; " + compiler_info();
}

PrimeResult find_prime(const PrimeConfig &cfg, EntropySource &entropy) {
  validate(cfg);
  detail::blocking_fetch fetch{entropy};
  return run_search(cfg, fetch);
}

std::future<PrimeResult> find_prime_async(const PrimeConfig &cfg,
                                          EntropySource &entropy) {
  validate(cfg);
  return std::async(std::launch::async, [cfg, &entropy] {
    detail::awaiting_fetch fetch{entropy};
    return run_search(cfg, fetch);
  });
}

mpz_class rand_prime(int bits, int iterations, bool enhanced,
                     EntropySource &entropy) {
  return find_prime(make_config(bits, iterations, enhanced, false), entropy)
      .value;
}

std::future<mpz_class> rand_prime_async(int bits, int iterations,
                                        bool enhanced, EntropySource &entropy) {
  const PrimeConfig cfg = make_config(bits, iterations, enhanced, false);
  validate(cfg);
  return std::async(std::launch::async, [cfg, &entropy] {
    detail::awaiting_fetch fetch{entropy};
    return run_search(cfg, fetch).value;
  });
}

mpz_class rand_safe_prime(int bits, int iterations, bool enhanced,
                          EntropySource &entropy) {
  return find_prime(make_config(bits, iterations, enhanced, true), entropy)
      .value;
}

std::future<mpz_class> rand_safe_prime_async(int bits, int iterations,
                                             bool enhanced,
                                             EntropySource &entropy) {
  const PrimeConfig cfg = make_config(bits, iterations, enhanced, true);
  validate(cfg);
  return std::async(std::launch::async, [cfg, &entropy] {
    detail::awaiting_fetch fetch{entropy};
    return run_search(cfg, fetch).value;
  });
}

} // namespace cr
