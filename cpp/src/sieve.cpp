// src/sieve.cpp
#include "cr/sieve.hpp"
#include "cr/log.hpp"

#include <algorithm> // std::lower_bound

namespace cr {

std::vector<std::uint32_t> generate_primes_up_to(std::uint32_t limit) {
  std::vector<std::uint32_t> primes;
  if (limit <= 2)
    return primes;

  std::vector<bool> composite(limit, false);
  for (std::uint64_t p = 2; p * p < limit; ++p) {
    if (composite[p])
      continue;
    for (std::uint64_t i = p * p; i < limit; i += p)
      composite[i] = true;
  }
  for (std::uint32_t p = 2; p < limit; ++p) {
    if (!composite[p])
      primes.push_back(p);
  }
  return primes;
}

PrimeTable SmallPrimeCache::get(std::uint32_t limit) {
  std::lock_guard<std::mutex> lock(mu_);

  auto it = entries_.find(limit);
  if (it != entries_.end())
    return it->second;

  // Smallest cached bound above the request.
  auto above = entries_.upper_bound(limit);
  if (above != entries_.end()) {
    if (above->first - limit < kReuseSlack)
      return above->second;

    const auto &larger = *above->second;
    auto end = std::lower_bound(larger.begin(), larger.end(), limit);
    auto filtered =
        std::make_shared<const std::vector<std::uint32_t>>(larger.begin(), end);
    ++filter_calls_;
    CR_LOG_DEBUG("sieve cache: filtered {} primes < {} from bound {}",
                 filtered->size(), limit, above->first);
    entries_.emplace(limit, filtered);
    return filtered;
  }

  auto fresh = std::make_shared<const std::vector<std::uint32_t>>(
      generate_primes_up_to(limit));
  ++generate_calls_;
  CR_LOG_DEBUG("sieve cache: generated {} primes < {}", fresh->size(), limit);
  entries_.emplace(limit, fresh);
  return fresh;
}

void SmallPrimeCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  generate_calls_ = 0;
  filter_calls_ = 0;
}

std::size_t SmallPrimeCache::generate_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return generate_calls_;
}

std::size_t SmallPrimeCache::filter_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return filter_calls_;
}

std::vector<std::uint32_t> SmallPrimeCache::cached_limits() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::uint32_t> out;
  out.reserve(entries_.size());
  for (const auto &e : entries_)
    out.push_back(e.first);
  return out;
}

SmallPrimeCache &SmallPrimeCache::global() {
  static SmallPrimeCache cache;
  return cache;
}

PrimeTable get_small_primes_for_sieve(std::uint32_t limit,
                                      SmallPrimeCache &cache) {
  return cache.get(limit);
}

bool combined_sieve_test(const mpz_class &p,
                         const std::vector<std::uint32_t> &small_primes) {
  const mpz_class q = (p - 1) / 2;
  for (std::uint32_t prime : small_primes) {
    // Parity is checked by the caller before sieving.
    if (prime == 2)
      continue;
    if (mpz_divisible_ui_p(p.get_mpz_t(), prime) && p != prime)
      return false;
    if (mpz_divisible_ui_p(q.get_mpz_t(), prime) && q != prime)
      return false;
  }
  return true;
}

} // namespace cr
