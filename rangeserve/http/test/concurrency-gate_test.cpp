#include "rangeserve/concurrency-gate.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace rangeserve {

TEST(ConcurrencyGate, ZeroCapacityIsRejected) { EXPECT_THROW(ConcurrencyGate(0), std::invalid_argument); }

TEST(ConcurrencyGate, AcquireUpToCapacity) {
  ConcurrencyGate gate(2);
  auto first = gate.tryAcquire();
  auto second = gate.tryAcquire();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(*first);
  EXPECT_EQ(gate.active(), 2U);

  EXPECT_FALSE(gate.tryAcquire().has_value());
  EXPECT_EQ(gate.active(), 2U);

  first->release();
  EXPECT_FALSE(*first);
  EXPECT_EQ(gate.active(), 1U);

  auto third = gate.tryAcquire();
  EXPECT_TRUE(third.has_value());
  EXPECT_EQ(gate.active(), 2U);
}

TEST(ConcurrencyGate, TokenReleasesOnDestruction) {
  ConcurrencyGate gate(1);
  {
    auto token = gate.tryAcquire();
    ASSERT_TRUE(token.has_value());
    EXPECT_FALSE(gate.tryAcquire().has_value());
  }
  EXPECT_EQ(gate.active(), 0U);
  EXPECT_TRUE(gate.tryAcquire().has_value());
}

TEST(ConcurrencyGate, TokenIsReleasedExactlyOnce) {
  ConcurrencyGate gate(2);
  auto token = gate.tryAcquire();
  auto other = gate.tryAcquire();
  ASSERT_TRUE(token.has_value());
  token->release();
  token->release();
  EXPECT_EQ(gate.active(), 1U);
  token.reset();
  EXPECT_EQ(gate.active(), 1U);
}

TEST(ConcurrencyGate, MoveTransfersOwnership) {
  ConcurrencyGate gate(1);
  auto acquired = gate.tryAcquire();
  ASSERT_TRUE(acquired.has_value());

  ConcurrencyToken moved(std::move(*acquired));
  EXPECT_FALSE(*acquired);  // NOLINT(bugprone-use-after-move)
  EXPECT_TRUE(moved);
  acquired.reset();
  EXPECT_EQ(gate.active(), 1U);

  ConcurrencyToken assigned;
  EXPECT_FALSE(assigned);
  assigned = std::move(moved);
  EXPECT_EQ(gate.active(), 1U);
  assigned = ConcurrencyToken{};
  EXPECT_EQ(gate.active(), 0U);
}

TEST(ConcurrencyGate, ConcurrentAcquisitionsNeverExceedCapacity) {
  static constexpr std::uint32_t kCapacity = 3;
  static constexpr int kNbThreads = 8;
  static constexpr int kNbIterations = 2000;

  ConcurrencyGate gate(kCapacity);
  std::atomic<std::uint32_t> maxSeen{0};
  std::atomic<int> nbAdmitted{0};

  std::vector<std::jthread> threads;
  threads.reserve(kNbThreads);
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&gate, &maxSeen, &nbAdmitted] {
      for (int iter = 0; iter < kNbIterations; ++iter) {
        auto token = gate.tryAcquire();
        if (token) {
          nbAdmitted.fetch_add(1, std::memory_order_relaxed);
          const auto active = gate.active();
          auto prevMax = maxSeen.load();
          while (active > prevMax && !maxSeen.compare_exchange_weak(prevMax, active)) {
          }
        }
      }
    });
  }
  threads.clear();

  EXPECT_LE(maxSeen.load(), kCapacity);
  EXPECT_GT(nbAdmitted.load(), 0);
  EXPECT_EQ(gate.active(), 0U);
}

}  // namespace rangeserve
