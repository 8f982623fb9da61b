// src/gaussian.cpp
#include "cr/error.hpp"
#include "cr/lattice.hpp"
#include "detail/fetch.hpp"

#include <cstdint>
#include <string>

namespace cr {

// Instruction count and entropy requests are independent of r, of the
// magnitude found and of the sign. This holds only as long as the compiler
// keeps the mask arithmetic branch-free; treat it as best effort.
int discrete_gaussian_sample(const CdtTable &table, EntropySource &entropy) {
  if (!is_valid_cdt_table(table))
    throw no_table_for_sigma("CDT table is empty or not non-increasing");

  detail::blocking_fetch fetch{entropy};
  const Bytes rb = fetch(2);
  const std::uint32_t r = (static_cast<std::uint32_t>(rb[0]) << 8) | rb[1];

  std::uint32_t x = 0;
  std::uint32_t active = 1;
  for (const std::uint16_t t : table) {
    // r < t exactly when r - t wraps; both operands are below 2^16.
    const std::uint32_t below = (r - static_cast<std::uint32_t>(t)) >> 31;
    active &= below;
    x += active;
  }

  const Bytes sb = fetch(1);
  const std::int32_t sign = (static_cast<std::int32_t>(sb[0] & 1u) << 1) - 1;
  return sign * static_cast<std::int32_t>(x);
}

int discrete_gaussian_sample(double sigma, const CdtTables &tables,
                             EntropySource &entropy) {
  auto it = tables.find(sigma);
  if (it == tables.end() || !is_valid_cdt_table(it->second))
    throw no_table_for_sigma("no CDT table for sigma " + std::to_string(sigma));
  return discrete_gaussian_sample(it->second, entropy);
}

} // namespace cr
