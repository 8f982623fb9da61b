// src/detail/fetch.hpp
#pragma once
#include "cr/entropy.hpp"
#include "cr/error.hpp"

#include <cstddef>
#include <gmpxx.h>
#include <string>

namespace cr::detail {

// Entropy acquisition strategies. The search algorithms are templates over
// one of these, so the blocking and async entry points share one body and
// the async form suspends only inside get_bytes_async().
inline Bytes checked(Bytes b, std::size_t n) {
  if (b.size() != n)
    throw entropy_unavailable("entropy source returned " +
                              std::to_string(b.size()) + " of " +
                              std::to_string(n) + " bytes");
  return b;
}

struct blocking_fetch {
  EntropySource &src;
  Bytes operator()(std::size_t n) const { return checked(src.get_bytes(n), n); }
};

struct awaiting_fetch {
  EntropySource &src;
  Bytes operator()(std::size_t n) const {
    return checked(src.get_bytes_async(n).get(), n);
  }
};

// Big-endian unsigned import.
inline mpz_class import_be(const Bytes &b) {
  mpz_class r;
  mpz_import(r.get_mpz_t(), b.size(), 1, 1, 1, 0, b.data());
  return r;
}

inline std::size_t byte_length(const mpz_class &n) {
  return (mpz_sizeinbase(n.get_mpz_t(), 2) + 7) / 8;
}

template <class Fetch> mpz_class sample_big_int(int bits, Fetch &fetch) {
  mpz_class r = import_be(fetch((static_cast<std::size_t>(bits) + 7) / 8));
  // OR-in the top and bottom bits; random bits above bits-1 in the top byte
  // are left alone, so the bit length may exceed `bits`.
  mpz_setbit(r.get_mpz_t(), static_cast<mp_bitcnt_t>(bits - 1));
  mpz_setbit(r.get_mpz_t(), 0);
  return r;
}

} // namespace cr::detail
