// src/modular.cpp
#include "cr/modular.hpp"
#include "cr/error.hpp"

#include <utility>

namespace cr {

mpz_class mod_pow(mpz_class base, mpz_class exponent,
                  const mpz_class &modulus) {
  if (sgn(modulus) <= 0)
    throw invalid_parameter("modulus must be positive");
  if (sgn(exponent) < 0)
    throw invalid_parameter("exponent must be non-negative");
  if (modulus == 1)
    return 0;

  mpz_class r = 1;
  base %= modulus;
  if (sgn(base) < 0)
    base += modulus;
  while (sgn(exponent) > 0) {
    if (mpz_odd_p(exponent.get_mpz_t()))
      r = r * base % modulus;
    exponent >>= 1;
    base = base * base % modulus;
  }
  return r;
}

mpz_class mod_inverse(const mpz_class &a, const mpz_class &m) {
  if (sgn(m) <= 0)
    throw invalid_parameter("modulus must be positive");

  mpz_class old_r = a % m, r = m;
  if (sgn(old_r) < 0)
    old_r += m;
  mpz_class old_s = 1, s = 0;

  while (r != 0) {
    const mpz_class q = old_r / r;
    mpz_class next_r = old_r - q * r;
    mpz_class next_s = old_s - q * s;
    old_r.swap(r);
    r.swap(next_r);
    old_s.swap(s);
    s.swap(next_s);
  }
  if (old_r != 1)
    throw no_inverse("modular inverse does not exist");

  mpz_class out = old_s % m;
  if (sgn(out) < 0)
    out += m;
  return out;
}

mpz_class gcd(mpz_class a, mpz_class b) {
  while (b != 0) {
    mpz_class t = b;
    b = a % b;
    a = std::move(t);
  }
  return abs(a);
}

} // namespace cr
