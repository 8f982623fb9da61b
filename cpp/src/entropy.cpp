// src/entropy.cpp
#include "cr/entropy.hpp"
#include "cr/error.hpp"
#include "cr/log.hpp"

#include <algorithm> // std::min
#include <climits>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <string>

namespace cr {

std::future<Bytes> EntropySource::get_bytes_async(std::size_t n) {
  return std::async(std::launch::deferred, [this, n] { return get_bytes(n); });
}

Bytes SystemEntropy::get_bytes(std::size_t n) {
  Bytes out(n);
  std::size_t off = 0;
  // RAND_bytes takes an int length.
  while (off < n) {
    const std::size_t chunk = std::min<std::size_t>(n - off, INT_MAX);
    if (RAND_bytes(out.data() + off, static_cast<int>(chunk)) != 1) {
      char buf[256] = {0};
      ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
      CR_LOG_ERROR("RAND_bytes failed for {} bytes: {}", chunk, buf);
      throw entropy_unavailable(std::string("no secure random source: ") +
                                buf);
    }
    off += chunk;
  }
  return out;
}

EntropySource &system_entropy() {
  static SystemEntropy source;
  return source;
}

} // namespace cr
