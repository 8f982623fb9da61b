// tests/test_entropy.hpp
#pragma once
#include "cr/entropy.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <utility>
#include <vector>

namespace crtest {

// Cycles through `pattern` across calls and records every request size.
class CyclicEntropy : public cr::EntropySource {
public:
  explicit CyclicEntropy(cr::Bytes pattern) : pattern_(std::move(pattern)) {}

  cr::Bytes get_bytes(std::size_t n) override {
    std::lock_guard<std::mutex> lock(mu_);
    requests_.push_back(n);
    cr::Bytes out(n);
    for (auto& b : out) {
      b = pattern_[pos_];
      pos_ = (pos_ + 1) % pattern_.size();
    }
    return out;
  }

  std::vector<std::size_t> requests() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

private:
  mutable std::mutex mu_;
  cr::Bytes pattern_;
  std::size_t pos_ = 0;
  std::vector<std::size_t> requests_;
};

// Reproducible xorshift64* stream; not secure, only for determinism checks.
class XorshiftEntropy : public cr::EntropySource {
public:
  explicit XorshiftEntropy(std::uint64_t seed) : state_(seed ? seed : 1) {}

  cr::Bytes get_bytes(std::size_t n) override {
    cr::Bytes out(n);
    for (auto& b : out) {
      state_ ^= state_ >> 12;
      state_ ^= state_ << 25;
      state_ ^= state_ >> 27;
      b = static_cast<std::uint8_t>((state_ * 0x2545F4914F6CDD1DULL) >> 56);
    }
    return out;
  }

private:
  std::uint64_t state_;
};

// Forwards to `inner`, counting blocking and suspending requests separately.
// The async form runs on its own thread.
class CountingEntropy : public cr::EntropySource {
public:
  explicit CountingEntropy(cr::EntropySource& inner) : inner_(inner) {}

  cr::Bytes get_bytes(std::size_t n) override {
    ++sync_calls;
    return inner_.get_bytes(n);
  }

  std::future<cr::Bytes> get_bytes_async(std::size_t n) override {
    ++async_calls;
    return std::async(std::launch::async, [this, n] { return inner_.get_bytes(n); });
  }

  std::atomic<std::size_t> sync_calls{0};
  std::atomic<std::size_t> async_calls{0};

private:
  cr::EntropySource& inner_;
};

// Always hands back one byte too few.
class ShortEntropy : public cr::EntropySource {
public:
  cr::Bytes get_bytes(std::size_t n) override { return cr::Bytes(n ? n - 1 : 0, 0x55); }
};

} // namespace crtest
