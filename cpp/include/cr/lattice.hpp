// include/cr/lattice.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "entropy.hpp"

namespace cr {

// Entry i is round(2^16 * P(|X| > i)) for the folded discrete Gaussian of
// the table's sigma; non-increasing, zero entries dropped. The first entry
// is well below 65535 (57366 for sigma 3.2). Cumulative tables whose first
// entry is near 65535 are a different format: passed here they validate but
// sample far too wide. Build tables with make_cdt_table().
using CdtTable = std::vector<std::uint16_t>;
using CdtTables = std::map<double, CdtTable>; // keyed by sigma

enum class LatticeOutput { integer, normalized };

struct LatticeConfig {
  std::size_t dimension = 512;
  std::uint32_t modulus = 12289;
  double sigma = 3.2;
  LatticeOutput output = LatticeOutput::integer;
};

// Built-in tables for sigma 3.2 and 178.56.
const CdtTables& default_cdt_tables();

// Table for `sigma` with the tail cut at tailcut * sigma.
// Throws invalid_parameter for non-positive arguments or when every entry
// rounds to zero.
CdtTable make_cdt_table(double sigma, double tailcut = 13.0);

// Non-empty and non-increasing.
bool is_valid_cdt_table(const CdtTable& table) noexcept;

// Constant-time CDT sample: one 16-bit draw, a full pass over the table, one
// sign byte. Throws no_table_for_sigma for an invalid table.
int discrete_gaussian_sample(const CdtTable& table,
                             EntropySource& entropy = system_entropy());

// Looks sigma up in `tables` (exact key). Throws no_table_for_sigma when
// there is no valid table for it.
int discrete_gaussian_sample(double sigma,
                             const CdtTables& tables = default_cdt_tables(),
                             EntropySource& entropy = system_entropy());

// One LWE sample b = (<a, s> + e) mod modulus with s in {-1,0,1}^dimension,
// a uniform in [0, modulus)^dimension and e drawn from the CDT for sigma.
// Falls back to the built-in tables when `tables` has no valid entry for
// sigma. Throws invalid_parameter for dimension < 1 or modulus < 2.
std::uint32_t rand_lattice_residue(std::size_t dimension, std::uint32_t modulus,
                                   double sigma,
                                   const CdtTables& tables = default_cdt_tables(),
                                   EntropySource& entropy = system_entropy());

// Residue as a double, or residue / modulus in [0, 1) when normalized.
double rand_lattice(std::size_t dimension, std::uint32_t modulus, double sigma,
                    LatticeOutput mode,
                    const CdtTables& tables = default_cdt_tables(),
                    EntropySource& entropy = system_entropy());

double rand_lattice(const LatticeConfig& cfg,
                    EntropySource& entropy = system_entropy());

} // namespace cr
