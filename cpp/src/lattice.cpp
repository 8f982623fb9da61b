// src/lattice.cpp
#include "cr/error.hpp"
#include "cr/lattice.hpp"
#include "cr/log.hpp"
#include "detail/fetch.hpp"

#include <cstdint>
#include <limits>
#include <openssl/crypto.h>
#include <string>
#include <vector>

namespace cr {
namespace {

const CdtTable &resolve_table(double sigma, const CdtTables &tables) {
  auto it = tables.find(sigma);
  if (it != tables.end() && is_valid_cdt_table(it->second))
    return it->second;

  const CdtTables &defaults = default_cdt_tables();
  auto d = defaults.find(sigma);
  if (d == defaults.end())
    throw no_table_for_sigma("no CDT table for sigma " + std::to_string(sigma));
  CR_LOG_DEBUG("lattice: using built-in CDT table for sigma {}", sigma);
  return d->second;
}

// {-1, 0, 1}^dimension from 2-bit codes, four per byte, low bits first.
// Codes 0 and 3 map to 0, 1 to -1, 2 to 1.
std::vector<std::int8_t> secret_vector(std::size_t dimension,
                                       const Bytes &bytes) {
  std::vector<std::int8_t> s(dimension);
  for (std::size_t i = 0; i < dimension; ++i) {
    const std::uint32_t code = (bytes[i / 4] >> (2 * (i % 4))) & 3u;
    s[i] = static_cast<std::int8_t>(static_cast<std::int32_t>((code >> 1) & 1u) -
                                    static_cast<std::int32_t>(code & 1u));
  }
  return s;
}

// Uniform row in [0, modulus): one big-endian 32-bit word per element.
std::vector<std::uint32_t> matrix_row(std::size_t dimension,
                                      std::uint32_t modulus,
                                      const Bytes &bytes) {
  std::vector<std::uint32_t> a(dimension);
  for (std::size_t i = 0; i < dimension; ++i) {
    const std::uint8_t *w = bytes.data() + 4 * i;
    const std::uint32_t word = (static_cast<std::uint32_t>(w[0]) << 24) |
                               (static_cast<std::uint32_t>(w[1]) << 16) |
                               (static_cast<std::uint32_t>(w[2]) << 8) |
                               static_cast<std::uint32_t>(w[3]);
    a[i] = word % modulus;
  }
  return a;
}

} // namespace

std::uint32_t rand_lattice_residue(std::size_t dimension, std::uint32_t modulus,
                                   double sigma, const CdtTables &tables,
                                   EntropySource &entropy) {
  if (dimension < 1 ||
      dimension > std::numeric_limits<std::size_t>::max() / 4)
    throw invalid_parameter("dimension must be a positive integer");
  if (modulus < 2)
    throw invalid_parameter("modulus must be an integer >= 2");
  const CdtTable &table = resolve_table(sigma, tables);
  CR_LOG_DEBUG("lattice: dimension {}, modulus {}, sigma {}, {} table entries",
               dimension, modulus, sigma, table.size());

  detail::blocking_fetch fetch{entropy};
  Bytes secret_bytes = fetch((dimension + 3) / 4);
  std::vector<std::int8_t> s = secret_vector(dimension, secret_bytes);
  const std::vector<std::uint32_t> a =
      matrix_row(dimension, modulus, fetch(4 * dimension));

  const std::int64_t q = modulus;
  std::int64_t acc = 0;
  for (std::size_t i = 0; i < dimension; ++i)
    acc = ((acc + static_cast<std::int64_t>(a[i]) * s[i]) % q + q) % q;

  OPENSSL_cleanse(secret_bytes.data(), secret_bytes.size());
  OPENSSL_cleanse(s.data(), s.size());

  const std::int64_t e = discrete_gaussian_sample(table, entropy);
  return static_cast<std::uint32_t>(((acc + e) % q + q) % q);
}

double rand_lattice(std::size_t dimension, std::uint32_t modulus, double sigma,
                    LatticeOutput mode, const CdtTables &tables,
                    EntropySource &entropy) {
  const std::uint32_t b =
      rand_lattice_residue(dimension, modulus, sigma, tables, entropy);
  if (mode == LatticeOutput::normalized)
    return static_cast<double>(b) / static_cast<double>(modulus);
  return static_cast<double>(b);
}

double rand_lattice(const LatticeConfig &cfg, EntropySource &entropy) {
  return rand_lattice(cfg.dimension, cfg.modulus, cfg.sigma, cfg.output,
                      default_cdt_tables(), entropy);
}

} // namespace cr
