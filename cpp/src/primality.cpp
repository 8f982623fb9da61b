// src/primality.cpp
#include "cr/primality.hpp"
#include "cr/error.hpp"
#include "detail/miller_rabin.hpp"

#include <utility>

namespace cr {
namespace {
void check_rounds(int k) {
  if (k < 1)
    throw invalid_parameter("number of iterations must be a positive integer");
}
} // namespace

bool is_probable_prime(const mpz_class &n, int k, EntropySource &entropy,
                       bool enhanced) {
  check_rounds(k);
  detail::blocking_fetch fetch{entropy};
  return detail::probable_prime(n, k, fetch, enhanced);
}

std::future<bool> is_probable_prime_async(mpz_class n, int k,
                                          EntropySource &entropy,
                                          bool enhanced) {
  check_rounds(k);
  return std::async(std::launch::async,
                    [n = std::move(n), k, &entropy, enhanced] {
                      detail::awaiting_fetch fetch{entropy};
                      return detail::probable_prime(n, k, fetch, enhanced);
                    });
}

} // namespace cr
