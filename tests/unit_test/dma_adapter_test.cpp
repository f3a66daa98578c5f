/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "dma_adapter.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include "mocks/fake_platform.hpp"

using namespace std::chrono_literals;

class DmaAdapterTest : public ::testing::Test {
 protected:
  test_env::FakeMemoryService memory_;
  test_env::FakeClock clock_;
  DmaAdapter dma_{memory_, clock_};
};

TEST_F(DmaAdapterTest, AllocReturnsZeroedAlignedBuffer) {
  auto buffer = dma_.AllocCoherent(100);
  ASSERT_TRUE(buffer.IsValid());
  EXPECT_EQ(buffer.size, 100U);
  EXPECT_EQ(memory_.LastAlignment(), 8U);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(buffer.cpu_addr) % 8, 0U);
  EXPECT_EQ(buffer.bus_addr, reinterpret_cast<uintptr_t>(buffer.cpu_addr));

  const auto* bytes = static_cast<const uint8_t*>(buffer.cpu_addr);
  for (size_t i = 0; i < buffer.size; ++i) {
    EXPECT_EQ(bytes[i], 0);
  }
  dma_.DeallocCoherent(buffer);
}

TEST_F(DmaAdapterTest, DeallocHandsBackExactAllocation) {
  std::vector<DmaBuffer> buffers;
  for (size_t size : {16U, 4096U, 1U, 12345U}) {
    buffers.push_back(dma_.AllocCoherent(size));
    ASSERT_TRUE(buffers.back().IsValid());
  }
  EXPECT_EQ(memory_.OutstandingBytes(), 16U + 4096U + 1U + 12345U);

  for (const auto& buffer : buffers) {
    dma_.DeallocCoherent(buffer);
  }
  EXPECT_EQ(memory_.OutstandingBytes(), 0U);
  EXPECT_EQ(memory_.FreeCount(), buffers.size());
  EXPECT_EQ(memory_.MismatchCount(), 0U);
}

TEST_F(DmaAdapterTest, AllocFailureReturnsSentinel) {
  memory_.FailNextAllocation();
  auto buffer = dma_.AllocCoherent(64);
  EXPECT_FALSE(buffer.IsValid());
  EXPECT_EQ(buffer.bus_addr, 0U);
  EXPECT_EQ(buffer.cpu_addr, nullptr);
  EXPECT_EQ(buffer.size, 0U);

  // 失败记录可以安全交回
  dma_.DeallocCoherent(buffer);
  EXPECT_EQ(memory_.FreeCount(), 0U);
}

TEST_F(DmaAdapterTest, ZeroSizeAllocationIsRejected) {
  EXPECT_FALSE(dma_.AllocCoherent(0).IsValid());
  EXPECT_EQ(memory_.AllocCount(), 0U);
}

TEST_F(DmaAdapterTest, InvalidAlignmentFallsBackToDefault) {
  DmaAdapter dma(memory_, clock_, DmaConfig{.alignment = 24, .bus_offset = 0});
  EXPECT_EQ(dma.GetConfig().alignment, 8U);

  DmaAdapter page(memory_, clock_,
                  DmaConfig{.alignment = 4096, .bus_offset = 0});
  auto buffer = page.AllocCoherent(10);
  ASSERT_TRUE(buffer.IsValid());
  EXPECT_EQ(reinterpret_cast<uintptr_t>(buffer.cpu_addr) % 4096, 0U);
  page.DeallocCoherent(buffer);
  EXPECT_EQ(memory_.MismatchCount(), 0U);
}

TEST_F(DmaAdapterTest, BusOffsetAppliesToDeviceAddresses) {
  DmaAdapter dma(memory_, clock_,
                 DmaConfig{.alignment = 8, .bus_offset = 0xC000'0000});
  auto buffer = dma.AllocCoherent(32);
  ASSERT_TRUE(buffer.IsValid());
  const auto paddr = reinterpret_cast<uintptr_t>(buffer.cpu_addr);
  EXPECT_EQ(buffer.bus_addr, paddr + 0xC000'0000);
  EXPECT_EQ(dma.BusToPhys(buffer.bus_addr), paddr);
  dma.DeallocCoherent(buffer);
}

TEST(DmaAdapterTranslationTest, MmioConversionRoundTrips) {
  test_env::FakeMemoryService memory(0xFFFF'FFC0'0000'0000);
  test_env::FakeClock clock;
  DmaAdapter dma(memory, clock);

  constexpr uintptr_t kPhys = 0x1000'1000;
  const auto virt = dma.MmioPhysToVirt(kPhys);
  EXPECT_EQ(virt, 0xFFFF'FFC0'1000'1000);
  EXPECT_EQ(dma.MmioVirtToPhys(virt), kPhys);
}

TEST_F(DmaAdapterTest, WaitUntilAlwaysSucceedsAfterDuration) {
  const auto start = clock_.Peek();
  auto result = dma_.WaitUntil(10us);
  EXPECT_TRUE(result.has_value());
  EXPECT_GE(clock_.Peek() - start, 10us);
}

TEST_F(DmaAdapterTest, WaitUntilZeroDurationReturnsImmediately) {
  EXPECT_TRUE(dma_.WaitUntil(0ns).has_value());
  EXPECT_LE(clock_.Reads(), 2U);
}

TEST_F(DmaAdapterTest, MapRegisterWindowRejectsEmptyRegion) {
  EXPECT_FALSE(dma_.MapRegisterWindow({0, 0x1000}).IsValid());
  EXPECT_FALSE(dma_.MapRegisterWindow({0x1000, 0}).IsValid());
}

class MmioWindowTest : public DmaAdapterTest {
 protected:
  auto Map() -> MmioWindow {
    return dma_.MapRegisterWindow(
        {reinterpret_cast<uintptr_t>(regs_.data()), sizeof(regs_)});
  }

  alignas(8) std::array<uint32_t, 16> regs_{};
};

TEST_F(MmioWindowTest, ReadsAndWritesBackingRegisters) {
  regs_[1] = 0xCAFE'F00D;
  auto window = Map();
  ASSERT_TRUE(window.IsValid());
  EXPECT_EQ(window.Size(), sizeof(regs_));
  EXPECT_EQ(window.PhysBase(), reinterpret_cast<uintptr_t>(regs_.data()));

  EXPECT_EQ(window.Read<uint32_t>(4), 0xCAFE'F00DU);
  window.Write<uint32_t>(8, 0x1234'5678);
  EXPECT_EQ(regs_[2], 0x1234'5678U);
}

TEST_F(MmioWindowTest, TryAccessChecksBoundsAndAlignment) {
  auto window = Map();

  auto out = window.TryRead<uint32_t>(sizeof(regs_));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, ErrorCode::kMmioOutOfWindow);

  auto unaligned = window.TryWrite<uint32_t>(2, 1);
  ASSERT_FALSE(unaligned.has_value());
  EXPECT_EQ(unaligned.error().code, ErrorCode::kMmioUnaligned);

  EXPECT_TRUE(window.TryWrite<uint16_t>(2, 0xBEEF).has_value());
  auto last = window.TryRead<uint32_t>(sizeof(regs_) - 4);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last.value(), 0U);
}

TEST_F(MmioWindowTest, MoveLeavesSourceInvalid) {
  auto window = Map();
  auto moved = std::move(window);
  EXPECT_TRUE(moved.IsValid());
  EXPECT_FALSE(window.IsValid());  // NOLINT(bugprone-use-after-move)
  EXPECT_FALSE(window.TryRead<uint32_t>(0).has_value());
}
