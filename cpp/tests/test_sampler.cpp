#include "cr/error.hpp"
#include "cr/sampler.hpp"
#include "test_entropy.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <gmpxx.h>

namespace {
std::size_t bit_length(const mpz_class& v) { return mpz_sizeinbase(v.get_mpz_t(), 2); }
} // namespace

TEST_CASE("rand_big_int: top bit set, odd, bounded length") {
  const int bits = GENERATE(2, 3, 7, 8, 9, 15, 16, 17, 31, 64, 127, 128, 255, 256, 511,
                            1024, 2047, 4096);
  for (int i = 0; i < 20; ++i) {
    const mpz_class v = cr::rand_big_int(bits);
    REQUIRE(mpz_odd_p(v.get_mpz_t()));
    REQUIRE(mpz_tstbit(v.get_mpz_t(), bits - 1) == 1);
    REQUIRE(bit_length(v) >= static_cast<std::size_t>(bits));
    REQUIRE(bit_length(v) <= 8 * ((static_cast<std::size_t>(bits) + 7) / 8));
  }
}

TEST_CASE("rand_big_int: all-zero stream gives 2^(bits-1) + 1") {
  const int bits = GENERATE(2, 5, 8, 13, 64, 521);
  crtest::CyclicEntropy zero({0x00});
  const mpz_class v = cr::rand_big_int(bits, zero);
  const mpz_class expected = (mpz_class(1) << (bits - 1)) + 1;
  REQUIRE(v == expected);
  REQUIRE(bit_length(v) == static_cast<std::size_t>(bits));

  const auto req = zero.requests();
  REQUIRE(req.size() == 1);
  REQUIRE(req[0] == (static_cast<std::size_t>(bits) + 7) / 8);
}

TEST_CASE("rand_big_int: high bits of the top byte are kept") {
  crtest::CyclicEntropy ones({0xFF});
  const mpz_class v = cr::rand_big_int(12, ones);
  REQUIRE(v == 0xFFFF);
  REQUIRE(bit_length(v) == 16);
}

TEST_CASE("rand_big_int: rejects bit lengths below 2") {
  for (int bits : {1, 0, -5}) {
    REQUIRE_THROWS_AS(cr::rand_big_int(bits), cr::invalid_bit_length);
    REQUIRE_THROWS_AS(cr::rand_big_int_async(bits), cr::invalid_bit_length);
  }
}

TEST_CASE("rand_big_int: a short read is an entropy failure") {
  crtest::ShortEntropy short_src;
  REQUIRE_THROWS_AS(cr::rand_big_int(64, short_src), cr::entropy_unavailable);
}

TEST_CASE("rand_big_int_async: suspends only through get_bytes_async") {
  crtest::CountingEntropy counting(cr::system_entropy());
  const mpz_class v = cr::rand_big_int_async(256, counting).get();
  REQUIRE(mpz_tstbit(v.get_mpz_t(), 255) == 1);
  REQUIRE(mpz_odd_p(v.get_mpz_t()));
  REQUIRE(counting.async_calls.load() == 1);
  REQUIRE(counting.sync_calls.load() == 0);
}

TEST_CASE("rand_big_int: blocking and async agree on the same stream") {
  crtest::XorshiftEntropy a(42), b(42);
  REQUIRE(cr::rand_big_int(300, a) == cr::rand_big_int_async(300, b).get());
}
