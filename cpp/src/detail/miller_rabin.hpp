// src/detail/miller_rabin.hpp
#pragma once
#include "cr/log.hpp"
#include "cr/modular.hpp"
#include "detail/fetch.hpp"

#include <gmpxx.h>

namespace cr::detail {

// n - 1 = 2^r * d with d odd
struct odd_split {
  mp_bitcnt_t r;
  mpz_class d;
};

inline odd_split split_odd(const mpz_class &nm1) {
  odd_split s;
  s.r = mpz_scan1(nm1.get_mpz_t(), 0);
  s.d = nm1 >> s.r;
  return s;
}

template <class Fetch>
bool miller_rabin_standard(const mpz_class &n, int k, Fetch &fetch) {
  const mpz_class nm1 = n - 1;
  const mpz_class span = n - 4; // witnesses in [2, n-2]
  const odd_split s = split_odd(nm1);
  const std::size_t nbytes = byte_length(n);

  for (int i = 0; i < k; ++i) {
    const mpz_class a = import_be(fetch(nbytes)) % span + 2;
    mpz_class x = mod_pow(a, s.d, n);
    if (x == 1 || x == nm1)
      continue;

    bool witness_passes = false;
    for (mp_bitcnt_t j = 1; j < s.r; ++j) {
      x = x * x % n;
      if (x == nm1) {
        witness_passes = true;
        break;
      }
    }
    if (!witness_passes)
      return false;
  }
  return true;
}

// FIPS 186-5 distinguishes "composite with factor" from "composite, not a
// power of a prime"; both are reported as false, the factor only in traces.
inline void trace_composite(const mpz_class &n, const mpz_class &g) {
  if (!Logger::enabled(spdlog::level::trace))
    return;
  auto log = Logger::get();
  if (g > 1)
    log->trace("fips-mr: {} composite with factor {}", n.get_str(16),
               g.get_str(16));
  else
    log->trace("fips-mr: {} composite, not a prime power", n.get_str(16));
}

// FIPS 186-5 C.3.2
template <class Fetch>
bool miller_rabin_fips(const mpz_class &n, int k, Fetch &fetch) {
  const mpz_class nm1 = n - 1;
  const odd_split s = split_odd(nm1); // a = s.r, m = s.d
  const std::size_t nbytes = byte_length(n);

  for (int i = 0; i < k; ++i) {
    mpz_class b;
    do {
      b = import_be(fetch(nbytes)) % nm1;
    } while (b <= 1 || b >= nm1);

    mpz_class g = cr::gcd(b, n);
    if (g > 1) {
      trace_composite(n, g);
      return false;
    }

    mpz_class z = mod_pow(b, s.d, n);
    if (z == 1 || z == nm1)
      continue;

    bool round_passes = false;
    for (mp_bitcnt_t j = 1; j < s.r; ++j) {
      const mpz_class x = z;
      z = x * x % n;
      if (z == nm1) {
        round_passes = true;
        break;
      }
      if (z == 1) {
        trace_composite(n, cr::gcd(x - 1, n));
        return false;
      }
    }
    if (!round_passes) {
      trace_composite(n, cr::gcd(z - 1, n));
      return false;
    }
  }
  return true;
}

template <class Fetch>
bool probable_prime(const mpz_class &n, int k, Fetch &fetch, bool enhanced) {
  if (n <= 1)
    return false;
  if (n <= 3)
    return true;
  if (mpz_even_p(n.get_mpz_t()))
    return false;
  return enhanced ? miller_rabin_fips(n, k, fetch)
                  : miller_rabin_standard(n, k, fetch);
}

} // namespace cr::detail
