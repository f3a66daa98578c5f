/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "driver/virtio_driver.hpp"

#include <gtest/gtest.h>

#include "mocks/fake_platform.hpp"
#include "mocks/stub_drivers.hpp"

namespace {

auto MakePciDescriptor(uint16_t vendor_id, uint16_t device_id)
    -> PciDeviceDescriptor {
  return PciDeviceDescriptor{
      .function = {.bus = 0, .device = 5, .function = 0},
      .info = {.vendor_id = vendor_id,
               .device_id = device_id,
               .class_code = 0x01,
               .subclass = 0x00},
      .bar0 = IoBar{.port = 0xC040, .size = 0x40},
  };
}

}  // namespace

class VirtioDriverTest : public ::testing::Test {
 protected:
  test_env::FakeMemoryService memory_;
  test_env::FakeClock clock_;
  DmaAdapter dma_{memory_, clock_};
  test_env::FakePciRoot root_;
  test_env::StubVirtioFactory<BlockDriverOps> blk_factory_{"vda"};
  test_env::StubVirtioFactory<NetDriverOps> net_factory_{"eth0"};
};

TEST_F(VirtioDriverTest, DescribesItself) {
  VirtioBlkDriver blk(dma_, &blk_factory_);
  EXPECT_STREQ(blk.GetName(), "virtio-blk");
  EXPECT_EQ(blk.GetClass(), DeviceClass::kBlock);
  EXPECT_EQ(blk.GetFamily(), DriverFamily::kVirtio);

  VirtioGpuDriver gpu(dma_, nullptr);
  EXPECT_STREQ(gpu.GetName(), "virtio-gpu");
  EXPECT_EQ(gpu.GetClass(), DeviceClass::kDisplay);
}

TEST_F(VirtioDriverTest, MmioBlockDeviceIsBound) {
  test_env::FakeVirtioMmio slot(2);
  VirtioBlkDriver blk(dma_, &blk_factory_);

  auto handle = blk.ProbeMmio(slot.Region());
  ASSERT_TRUE(handle.has_value());
  EXPECT_EQ(handle->GetClass(), DeviceClass::kBlock);
  EXPECT_STREQ(handle->GetName(), "vda");
  EXPECT_EQ(blk_factory_.mmio_calls, 1U);
  EXPECT_EQ(blk_factory_.last_base, slot.Region().base);
}

TEST_F(VirtioDriverTest, LegacyVersionIsAccepted) {
  test_env::FakeVirtioMmio slot(1, 1);
  VirtioNetDriver net(dma_, &net_factory_);
  EXPECT_TRUE(net.ProbeMmio(slot.Region()).has_value());
}

TEST_F(VirtioDriverTest, OtherDeviceTypeIsNotAMatch) {
  test_env::FakeVirtioMmio slot(1);
  VirtioBlkDriver blk(dma_, &blk_factory_);
  EXPECT_FALSE(blk.ProbeMmio(slot.Region()).has_value());
  EXPECT_EQ(blk_factory_.mmio_calls, 0U);
}

TEST_F(VirtioDriverTest, EmptySlotIsNotAMatch) {
  test_env::FakeVirtioMmio slot(0);
  VirtioBlkDriver blk(dma_, &blk_factory_);
  EXPECT_FALSE(blk.ProbeMmio(slot.Region()).has_value());
}

TEST_F(VirtioDriverTest, BadMagicOrVersionIsRejected) {
  test_env::FakeVirtioMmio not_virtio(2, 2, 0xDEAD'BEEF);
  test_env::FakeVirtioMmio future(2, 3);
  VirtioBlkDriver blk(dma_, &blk_factory_);

  EXPECT_FALSE(blk.ProbeMmio(not_virtio.Region()).has_value());
  EXPECT_FALSE(blk.ProbeMmio(future.Region()).has_value());
  EXPECT_EQ(blk_factory_.mmio_calls, 0U);
}

TEST_F(VirtioDriverTest, RegionTooSmallForHeaderIsRejected) {
  test_env::FakeVirtioMmio slot(2);
  auto region = slot.Region();
  region.size = 8;
  VirtioBlkDriver blk(dma_, &blk_factory_);
  EXPECT_FALSE(blk.ProbeMmio(region).has_value());
}

TEST_F(VirtioDriverTest, TransportFailureClaimsDevice) {
  test_env::FakeVirtioMmio slot(2);
  blk_factory_.error = ErrorCode::kDeviceInitFailed;
  VirtioBlkDriver blk(dma_, &blk_factory_);

  auto result = blk.ProbeMmio(slot.Region());
  EXPECT_FALSE(result.has_value());
  ASSERT_TRUE(result.IsFailed());
  EXPECT_EQ(result.error().code, ErrorCode::kDeviceInitFailed);
  EXPECT_EQ(blk_factory_.mmio_calls, 1U);

  test_env::FakeVirtioMmio net_slot(1);
  EXPECT_FALSE(blk.ProbeMmio(net_slot.Region()).IsClaimed());
}

TEST_F(VirtioDriverTest, PciMatchesModernAndTransitionalIds) {
  VirtioBlkDriver blk(dma_, &blk_factory_);

  EXPECT_TRUE(blk.ProbePci(root_, MakePciDescriptor(0x1AF4, 0x1042))
                  .has_value());
  EXPECT_TRUE(blk.ProbePci(root_, MakePciDescriptor(0x1AF4, 0x1001))
                  .has_value());
  EXPECT_EQ(blk_factory_.pci_calls, 2U);
  EXPECT_EQ(blk_factory_.last_function.device, 5);

  EXPECT_FALSE(blk.ProbePci(root_, MakePciDescriptor(0x1AF4, 0x1041))
                   .has_value());
  EXPECT_FALSE(blk.ProbePci(root_, MakePciDescriptor(0x8086, 0x1042))
                   .has_value());
  EXPECT_EQ(blk_factory_.pci_calls, 2U);
}

TEST(VirtioIdTest, PciDeviceIds) {
  static_assert(virtio::ModernPciDeviceId(virtio::DeviceId::kNet) == 0x1041);
  static_assert(virtio::ModernPciDeviceId(virtio::DeviceId::kGpu) == 0x1050);
  static_assert(virtio::TransitionalPciDeviceId(virtio::DeviceId::kNet) ==
                0x1000);
  static_assert(virtio::TransitionalPciDeviceId(virtio::DeviceId::kGpu) == 0);

  EXPECT_TRUE(VirtioGpuDriver::Matches({.vendor_id = 0x1AF4,
                                        .device_id = 0x1050,
                                        .class_code = 0x03,
                                        .subclass = 0x00}));
  EXPECT_FALSE(VirtioGpuDriver::Matches({.vendor_id = 0x1AF4,
                                         .device_id = 0x0000,
                                         .class_code = 0x03,
                                         .subclass = 0x00}));
}
