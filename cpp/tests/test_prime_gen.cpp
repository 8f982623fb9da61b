#include "cr/cr.hpp"
#include "test_entropy.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <chrono>
#include <gmpxx.h>
#include <string>

namespace {
std::size_t bit_length(const mpz_class& v) { return mpz_sizeinbase(v.get_mpz_t(), 2); }
} // namespace

TEST_CASE("rand_prime: 256-bit probable prime") {
  const bool enhanced = GENERATE(false, true);
  const mpz_class p = cr::rand_prime(256, 20, enhanced);
  REQUIRE(mpz_tstbit(p.get_mpz_t(), 255) == 1);
  REQUIRE(bit_length(p) == 256);
  REQUIRE(cr::is_probable_prime(p, 40));
  REQUIRE(mpz_probab_prime_p(p.get_mpz_t(), 30) > 0);
}

TEST_CASE("rand_prime: small bit lengths") {
  // Unlike safe primes, plain primes keep whatever the top byte carries.
  for (int bits : {2, 3, 5, 8, 13}) {
    const mpz_class p = cr::rand_prime(bits);
    REQUIRE(mpz_tstbit(p.get_mpz_t(), bits - 1) == 1);
    REQUIRE(mpz_probab_prime_p(p.get_mpz_t(), 30) > 0);
  }
}

TEST_CASE("rand_safe_prime: 128-bit safe prime") {
  const bool enhanced = GENERATE(false, true);
  const mpz_class p = cr::rand_safe_prime(128, 20, enhanced);
  const mpz_class q = (p - 1) / 2;
  REQUIRE(bit_length(p) == 128);
  REQUIRE(mpz_probab_prime_p(p.get_mpz_t(), 30) > 0);
  REQUIRE(mpz_probab_prime_p(q.get_mpz_t(), 30) > 0);
  const mpz_class rem = p % 4;
  REQUIRE(rem == 3);
}

TEST_CASE("rand_safe_prime: 3 bits gives 7") {
  REQUIRE(cr::rand_safe_prime(3) == 7);
}

TEST_CASE("Validation happens before any entropy is drawn") {
  crtest::CyclicEntropy zero({0x00});
  for (int bits : {1, 0, -3}) {
    REQUIRE_THROWS_AS(cr::rand_prime(bits, 20, false, zero), cr::invalid_bit_length);
    REQUIRE_THROWS_AS(cr::rand_prime_async(bits, 20, false, zero), cr::invalid_bit_length);
    REQUIRE_THROWS_AS(cr::rand_safe_prime(bits, 20, false, zero), cr::invalid_bit_length);
    REQUIRE_THROWS_AS(cr::rand_safe_prime_async(bits, 20, false, zero),
                      cr::invalid_bit_length);
  }
  REQUIRE_THROWS_AS(cr::rand_safe_prime(2, 20, false, zero), cr::invalid_bit_length);
  for (int iterations : {0, -1}) {
    REQUIRE_THROWS_AS(cr::rand_prime(64, iterations, false, zero), cr::invalid_parameter);
    REQUIRE_THROWS_AS(cr::rand_prime_async(64, iterations, false, zero),
                      cr::invalid_parameter);
    REQUIRE_THROWS_AS(cr::rand_safe_prime(64, iterations, false, zero),
                      cr::invalid_parameter);
    REQUIRE_THROWS_AS(cr::rand_safe_prime_async(64, iterations, false, zero),
                      cr::invalid_parameter);
  }
  REQUIRE(zero.requests().empty());
}

TEST_CASE("find_prime: result metadata") {
  cr::PrimeConfig cfg;
  cfg.bits = 128;
  const auto res = cr::find_prime(cfg);
  REQUIRE(bit_length(res.value) == 128);
  REQUIRE(res.attempts >= 1);
  REQUIRE(res.engine_info.find("gmp:") != std::string::npos);
  REQUIRE(res.engine_info == cr::engine_info());
}

TEST_CASE("find_prime: attempt budget") {
  // A zero stream always proposes 2^63 + 1 = 3 * 3074457345618258603.
  crtest::CyclicEntropy zero({0x00});
  cr::PrimeConfig cfg;
  cfg.bits = 64;
  cfg.budget.max_attempts = 1;
  REQUIRE_THROWS_AS(cr::find_prime(cfg, zero), cr::search_exhausted);

  try {
    cfg.budget.max_attempts = 3;
    cr::find_prime(cfg, zero);
    FAIL("expected search_exhausted");
  } catch (const cr::search_exhausted& e) {
    REQUIRE(e.code() == cr::errc::search_exhausted);
    REQUIRE(std::string(e.what()).find("3 attempts") != std::string::npos);
  }
}

TEST_CASE("find_prime: time budget") {
  crtest::CyclicEntropy zero({0x00});
  cr::PrimeConfig cfg;
  cfg.bits = 64;
  cfg.budget.time_limit = std::chrono::milliseconds(5);
  REQUIRE_THROWS_AS(cr::find_prime(cfg, zero), cr::search_exhausted);
  REQUIRE_THROWS_AS(cr::find_prime_async(cfg, zero).get(), cr::search_exhausted);
}

TEST_CASE("find_prime: injected sieve cache") {
  cr::SmallPrimeCache cache;
  cr::PrimeConfig cfg;
  cfg.bits = 64;
  cfg.safe = true;
  cfg.sieve_cache = &cache;
  const auto res = cr::find_prime(cfg);
  REQUIRE(bit_length(res.value) == 64);
  REQUIRE(cache.generate_calls() == 1);
  REQUIRE(cache.cached_limits() == std::vector<std::uint32_t>{cr::kDefaultSieveLimit});
}

TEST_CASE("Async searches suspend through get_bytes_async only") {
  crtest::CountingEntropy counting(cr::system_entropy());

  const mpz_class p = cr::rand_prime_async(128, 20, false, counting).get();
  REQUIRE(bit_length(p) == 128);
  REQUIRE(mpz_probab_prime_p(p.get_mpz_t(), 30) > 0);

  const mpz_class s = cr::rand_safe_prime_async(64, 20, true, counting).get();
  const mpz_class q = (s - 1) / 2;
  REQUIRE(bit_length(s) == 64);
  REQUIRE(mpz_probab_prime_p(q.get_mpz_t(), 30) > 0);

  cr::PrimeConfig cfg;
  cfg.bits = 96;
  const auto res = cr::find_prime_async(cfg, counting).get();
  REQUIRE(bit_length(res.value) == 96);

  REQUIRE(counting.async_calls.load() > 0);
  REQUIRE(counting.sync_calls.load() == 0);
}

TEST_CASE("Same stream, same prime") {
  crtest::XorshiftEntropy a(7), b(7);
  REQUIRE(cr::rand_prime(160, 10, false, a) == cr::rand_prime_async(160, 10, false, b).get());
}

TEST_CASE("Entropy failures propagate out of the search") {
  crtest::ShortEntropy short_src;
  REQUIRE_THROWS_AS(cr::rand_prime(64, 20, false, short_src), cr::entropy_unavailable);
}

TEST_CASE("Diffie-Hellman agreement over a generated safe-prime group") {
  const mpz_class p = cr::rand_safe_prime(64);
  const mpz_class q = (p - 1) / 2;
  // 4 = 2^2 is a quadratic residue, so it generates the order-q subgroup.
  const mpz_class g = 4;
  REQUIRE(cr::mod_pow(g, q, p) == 1);

  const mpz_class a = cr::rand_big_int(48);
  const mpz_class b = cr::rand_big_int(48);
  const mpz_class A = cr::mod_pow(g, a, p);
  const mpz_class B = cr::mod_pow(g, b, p);
  REQUIRE(A != 1);
  REQUIRE(B != 1);

  const mpz_class shared_a = cr::mod_pow(B, a, p);
  const mpz_class shared_b = cr::mod_pow(A, b, p);
  REQUIRE(shared_a == shared_b);
  REQUIRE(cr::constant_time_compare(shared_a.get_str(16), shared_b.get_str(16)));
}

TEST_CASE("RSA round trip with generated primes") {
  const mpz_class e = 65537;
  mpz_class p, q, phi;
  do {
    p = cr::rand_prime(256);
    q = cr::rand_prime(256);
    phi = (p - 1) * (q - 1);
  } while (p == q || cr::gcd(e, phi) != 1);

  const mpz_class n = p * q;
  const mpz_class d = cr::mod_inverse(e, phi);
  const mpz_class ed = e * d % phi;
  REQUIRE(ed == 1);

  for (int i = 0; i < 5; ++i) {
    const mpz_class m = cr::rand_big_int(256);
    const mpz_class c = cr::mod_pow(m, e, n);
    REQUIRE(c != m);
    REQUIRE(cr::mod_pow(c, d, n) == m);
  }
}
