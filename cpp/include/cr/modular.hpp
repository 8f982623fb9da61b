// include/cr/modular.hpp
#pragma once
#include <gmpxx.h>

namespace cr {

// base^exponent mod modulus by square-and-multiply. Returns 0 for modulus 1.
// Throws invalid_parameter if modulus <= 0 or exponent < 0.
mpz_class mod_pow(mpz_class base, mpz_class exponent, const mpz_class& modulus);

// a^-1 mod m via the extended Euclidean algorithm, normalised to [0, m).
// Throws no_inverse when gcd(a, m) != 1, invalid_parameter when m <= 0.
mpz_class mod_inverse(const mpz_class& a, const mpz_class& m);

// Iterative Euclid; result is non-negative.
mpz_class gcd(mpz_class a, mpz_class b);

} // namespace cr
