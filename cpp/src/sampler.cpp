// src/sampler.cpp
#include "cr/sampler.hpp"
#include "cr/error.hpp"
#include "detail/fetch.hpp"

namespace cr {
namespace {
void check_bits(int bits) {
  if (bits < 2)
    throw invalid_bit_length(
        "bit length must be an integer greater than or equal to 2");
}
} // namespace

mpz_class rand_big_int(int bits, EntropySource &entropy) {
  check_bits(bits);
  detail::blocking_fetch fetch{entropy};
  return detail::sample_big_int(bits, fetch);
}

std::future<mpz_class> rand_big_int_async(int bits, EntropySource &entropy) {
  check_bits(bits);
  return std::async(std::launch::async, [bits, &entropy] {
    detail::awaiting_fetch fetch{entropy};
    return detail::sample_big_int(bits, fetch);
  });
}

} // namespace cr
