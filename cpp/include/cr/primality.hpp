// include/cr/primality.hpp
#pragma once
#include "entropy.hpp"

#include <future>
#include <gmpxx.h>

namespace cr {

// Miller-Rabin with k random witnesses. enhanced selects the FIPS 186-5
// C.3.2 variant (gcd pre-check on every witness). A prime always passes; a
// composite survives with probability at most 4^-k.
// Throws invalid_parameter if k < 1.
bool is_probable_prime(const mpz_class& n, int k,
                       EntropySource& entropy = system_entropy(),
                       bool enhanced = false);

std::future<bool> is_probable_prime_async(mpz_class n, int k,
                                          EntropySource& entropy = system_entropy(),
                                          bool enhanced = false);

} // namespace cr
