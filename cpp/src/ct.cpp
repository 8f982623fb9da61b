// src/ct.cpp
#include "cr/ct.hpp"

#include <algorithm> // std::min
#include <cstddef>
#include <openssl/crypto.h>

namespace cr {
namespace {

bool compare(const void *a, std::size_t a_len, const void *b,
             std::size_t b_len) noexcept {
  const std::size_t n = std::min(a_len, b_len);
  // CRYPTO_memcmp does not touch the pointers when n == 0.
  const unsigned diff = static_cast<unsigned>(CRYPTO_memcmp(a, b, n) != 0);
  const unsigned same_len = static_cast<unsigned>(a_len == b_len);
  return ((diff ^ 1u) & same_len) == 1u;
}

} // namespace

bool constant_time_compare(const Bytes &a, const Bytes &b) noexcept {
  return compare(a.data(), a.size(), b.data(), b.size());
}

bool constant_time_compare(const std::string &a,
                           const std::string &b) noexcept {
  return compare(a.data(), a.size(), b.data(), b.size());
}

} // namespace cr
