#pragma once

#include <atomic>
#include <cstdint>

namespace datamarket::chain {

/*
  Source of the ledger height stamped on records (createdAt/completedAt).

  Implementations must never go backwards.
*/
class HeightSource {
 public:
  virtual ~HeightSource() = default;

  virtual uint64_t CurrentHeight() const = 0;
};

// Height driven by the host; seeded from ledger.genesis_height.
class ManualHeightSource final : public HeightSource {
 public:
  explicit ManualHeightSource(uint64_t genesis = 0) : height_(genesis) {
  }

  uint64_t CurrentHeight() const override {
    return height_.load(std::memory_order_acquire);
  }

  // Throws std::invalid_argument when height is below the current one.
  void Set(uint64_t height);

  uint64_t Advance(uint64_t blocks = 1);

 private:
  std::atomic<uint64_t> height_;
};

} // namespace datamarket::chain
