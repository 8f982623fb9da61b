// include/cr/sampler.hpp
#pragma once
#include "entropy.hpp"

#include <future>
#include <gmpxx.h>

namespace cr {

// Random odd integer with bit (bits-1) set, from ceil(bits/8) big-endian
// bytes. Higher bits of the top byte are not cleared: when bits is not a
// multiple of 8 the result may be longer than `bits`.
// Throws invalid_bit_length if bits < 2.
mpz_class rand_big_int(int bits, EntropySource& entropy = system_entropy());

// Same, suspending only while the bytes are acquired. Validation errors are
// thrown before the task starts.
std::future<mpz_class> rand_big_int_async(int bits,
                                          EntropySource& entropy = system_entropy());

} // namespace cr
