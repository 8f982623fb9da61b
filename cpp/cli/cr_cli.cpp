#include "cr/cr.hpp"
#include "cr/lattice.hpp"
#include "cr/log.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {
enum class Mode { prime, safe, bigint, lattice, gaussian };

void usage() {
  std::cerr
      << "usage: cr_cli [--prime|--safe|--bigint|--lattice|--gaussian]\n"
         "              [--iter=K] [--enhanced] [--bench=N] [--max-attempts=N]\n"
         "              [--dim=D] [--mod=Q] [--sigma=S] [--normalized]\n"
         "              [--count=N] [--log=LEVEL] [BITS...]\n";
}
} // namespace

int main(int argc, char** argv) {
  Mode mode = Mode::prime;
  unsigned repeats = 1, count = 1;
  int iterations = 20;
  bool enhanced = false;
  std::uint64_t max_attempts = 0;
  cr::LatticeConfig lattice;
  std::vector<int> bit_lengths;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--prime") {
        mode = Mode::prime;
      } else if (a == "--safe") {
        mode = Mode::safe;
      } else if (a == "--bigint") {
        mode = Mode::bigint;
      } else if (a == "--lattice") {
        mode = Mode::lattice;
      } else if (a == "--gaussian") {
        mode = Mode::gaussian;
      } else if (a == "--enhanced") {
        enhanced = true;
      } else if (a == "--normalized") {
        lattice.output = cr::LatticeOutput::normalized;
      } else if (a.rfind("--iter=", 0) == 0) {
        iterations = std::stoi(a.substr(7));
      } else if (a.rfind("--bench=", 0) == 0) {
        repeats = std::stoul(a.substr(8));
      } else if (a.rfind("--max-attempts=", 0) == 0) {
        max_attempts = std::stoull(a.substr(15));
      } else if (a.rfind("--dim=", 0) == 0) {
        lattice.dimension = std::stoul(a.substr(6));
      } else if (a.rfind("--mod=", 0) == 0) {
        unsigned long q = std::stoul(a.substr(6));
        if (q > std::numeric_limits<std::uint32_t>::max()) {
          std::cerr << "modulus out of 32-bit range\n";
          return 2;
        }
        lattice.modulus = static_cast<std::uint32_t>(q);
      } else if (a.rfind("--sigma=", 0) == 0) {
        lattice.sigma = std::stod(a.substr(8));
      } else if (a.rfind("--count=", 0) == 0) {
        count = std::stoul(a.substr(8));
      } else if (a.rfind("--log=", 0) == 0) {
        cr::Logger::init(a.substr(6));
      } else if (a == "--help" || a == "-h") {
        usage();
        return 0;
      } else {
        int v = 0;
        try { v = std::stoi(a); } catch (const std::exception&) { std::cerr << "skip '"<<a<<"'\n"; continue; }
        bit_lengths.push_back(v);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "bad argument: " << e.what() << "\n";
    usage();
    return 2;
  }
  if (bit_lengths.empty()) bit_lengths = {256};

  try {
    if (mode == Mode::lattice || mode == Mode::gaussian) {
      for (unsigned n = 0; n < count; ++n) {
        if (mode == Mode::lattice)
          std::cout << cr::rand_lattice(lattice) << "\n";
        else
          std::cout << cr::discrete_gaussian_sample(lattice.sigma) << "\n";
      }
      return 0;
    }

    for (int bits : bit_lengths) {
      if (mode == Mode::bigint) {
        std::cout << "bigint[" << bits << "] → 0x"
                  << cr::rand_big_int(bits).get_str(16) << "\n";
        continue;
      }

      cr::PrimeConfig cfg;
      cfg.bits = bits;
      cfg.iterations = iterations;
      cfg.enhanced = enhanced;
      cfg.safe = (mode == Mode::safe);
      cfg.budget.max_attempts = max_attempts;

      std::uint64_t best = UINT64_MAX, sum = 0;
      for (unsigned r = 0; r < repeats; ++r) {
        auto res = cr::find_prime(cfg);
        sum += res.ns_elapsed; if (res.ns_elapsed < best) best = res.ns_elapsed;
        if (repeats == 1) {
          std::cout << (cfg.safe ? "safe" : "prime") << "[" << bits << "] → 0x"
                    << res.value.get_str(16)
                    << " | attempts=" << res.attempts
                    << " | core(ns)=" << res.ns_elapsed
                    << " | engine=" << res.engine_info << "\n";
        }
      }
      if (repeats > 1) {
        std::cout << (cfg.safe ? "safe" : "prime") << "[" << bits
                  << "] bench repeats=" << repeats
                  << " | best(ns)=" << best << " | avg(ns)=" << (sum / repeats) << "\n";
      }
    }
  } catch (const std::exception& e) {
    CR_LOG_ERROR("{}", e.what());
    return 1;
  }
  return 0;
}
