#include "internal/chain/height_source.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace datamarket::chain {

void ManualHeightSource::Set(uint64_t height) {
  uint64_t current = height_.load(std::memory_order_acquire);
  do {
    if (height < current) {
      throw std::invalid_argument("ledger height cannot go backwards: " + std::to_string(height) + " < " + std::to_string(current));
    }
  } while (!height_.compare_exchange_weak(current, height, std::memory_order_acq_rel));
}

uint64_t ManualHeightSource::Advance(uint64_t blocks) {
  uint64_t current = height_.load(std::memory_order_acquire);
  uint64_t next    = 0;
  do {
    if (blocks > std::numeric_limits<uint64_t>::max() - current) {
      throw std::overflow_error("ledger height overflow");
    }
    next = current + blocks;
  } while (!height_.compare_exchange_weak(current, next, std::memory_order_acq_rel));
  return next;
}

} // namespace datamarket::chain
