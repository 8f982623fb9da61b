// src/cdt.cpp
#include "cr/error.hpp"
#include "cr/lattice.hpp"

#include <algorithm> // std::min
#include <cmath>
#include <vector>

namespace cr {
namespace {

// make_cdt_table(3.2), tail cut at 13 sigma.
const CdtTable kSigma3_2 = {57366, 41804, 28362, 17832, 10351, 5530, 2713,
                            1219,  501,   188,   65,    20,    6,    1};

} // namespace

CdtTable make_cdt_table(double sigma, double tailcut) {
  if (!(sigma > 0.0) || !(tailcut > 0.0))
    throw invalid_parameter("sigma and tailcut must be positive");

  const auto k_max = static_cast<std::size_t>(std::ceil(tailcut * sigma));
  const double two_s2 = 2.0 * sigma * sigma;

  // suffix[k] = sum of rho(j) for j >= k, summed from the tail for accuracy
  std::vector<double> suffix(k_max + 2, 0.0);
  for (std::size_t k = k_max + 1; k-- > 0;) {
    const double kd = static_cast<double>(k);
    suffix[k] = suffix[k + 1] + std::exp(-kd * kd / two_s2);
  }
  // normaliser over all integers in [-k_max, k_max]
  const double z = 2.0 * suffix[0] - 1.0;

  CdtTable out;
  for (std::size_t i = 0; i <= k_max; ++i) {
    const long long v = std::llround(2.0 * suffix[i + 1] / z * 65536.0);
    if (v <= 0)
      break;
    out.push_back(static_cast<std::uint16_t>(std::min(v, 65535LL)));
  }
  if (out.empty())
    throw invalid_parameter("sigma too small for a 16-bit table");
  return out;
}

bool is_valid_cdt_table(const CdtTable &table) noexcept {
  if (table.empty())
    return false;
  return std::is_sorted(table.rbegin(), table.rend());
}

const CdtTables &default_cdt_tables() {
  static const CdtTables tables = {
      {3.2, kSigma3_2},
      {178.56, make_cdt_table(178.56)},
  };
  return tables;
}

} // namespace cr
