// include/cr/error.hpp
#pragma once
#include <stdexcept>
#include <string>

namespace cr {

// Stable error kinds; every exception below carries one.
enum class errc {
  invalid_bit_length,
  invalid_parameter,
  no_inverse,
  no_table_for_sigma,
  entropy_unavailable,
  search_exhausted,
};

inline const char* errc_name(errc e) noexcept {
  switch (e) {
  case errc::invalid_bit_length:
    return "InvalidBitLength";
  case errc::invalid_parameter:
    return "InvalidParameter";
  case errc::no_inverse:
    return "NoInverse";
  case errc::no_table_for_sigma:
    return "NoTableForSigma";
  case errc::entropy_unavailable:
    return "EntropyUnavailable";
  case errc::search_exhausted:
    return "SearchExhausted";
  }
  return "Unknown";
}

// bits is not an integer >= 2 (>= 3 for safe primes).
class invalid_bit_length : public std::invalid_argument {
public:
  explicit invalid_bit_length(const std::string& what)
      : std::invalid_argument(what) {}
  errc code() const noexcept { return errc::invalid_bit_length; }
};

// Iteration counts < 1, bad moduli, mismatched sizes.
class invalid_parameter : public std::invalid_argument {
public:
  explicit invalid_parameter(const std::string& what)
      : std::invalid_argument(what) {}
  errc code() const noexcept { return errc::invalid_parameter; }
};

class no_inverse : public std::domain_error {
public:
  explicit no_inverse(const std::string& what) : std::domain_error(what) {}
  errc code() const noexcept { return errc::no_inverse; }
};

// Missing, empty or non-monotone CDT table for the requested sigma.
class no_table_for_sigma : public std::invalid_argument {
public:
  explicit no_table_for_sigma(const std::string& what)
      : std::invalid_argument(what) {}
  errc code() const noexcept { return errc::no_table_for_sigma; }
};

class entropy_unavailable : public std::runtime_error {
public:
  explicit entropy_unavailable(const std::string& what)
      : std::runtime_error(what) {}
  errc code() const noexcept { return errc::entropy_unavailable; }
};

// A SearchBudget ran out before a prime was found.
class search_exhausted : public std::runtime_error {
public:
  explicit search_exhausted(const std::string& what)
      : std::runtime_error(what) {}
  errc code() const noexcept { return errc::search_exhausted; }
};

} // namespace cr
