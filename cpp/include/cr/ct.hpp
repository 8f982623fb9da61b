// include/cr/ct.hpp
#pragma once
#include <string>

#include "entropy.hpp"

namespace cr {

// Equality whose running time depends only on the input lengths. On a length
// mismatch the common prefix is still scanned and the result is false.
bool constant_time_compare(const Bytes& a, const Bytes& b) noexcept;
bool constant_time_compare(const std::string& a, const std::string& b) noexcept;

} // namespace cr
