/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "device_init.hpp"

#include <gtest/gtest.h>

#include "driver_config.hpp"
#include "hwprobe_config.hpp"
#include "mocks/fake_platform.hpp"
#include "mocks/stub_drivers.hpp"

TEST(DriverConfigTest, DefaultEnablesVirtioDevices) {
  auto config = DriverConfig::Default();
  ASSERT_EQ(config.net.size(), 1U);
  EXPECT_EQ(config.net[0], DriverKind::kVirtioNet);
  ASSERT_EQ(config.block.size(), 1U);
  EXPECT_EQ(config.block[0], DriverKind::kVirtioBlk);
  ASSERT_EQ(config.display.size(), 1U);
  EXPECT_EQ(config.display[0], DriverKind::kVirtioGpu);
  EXPECT_EQ(config.ramdisk_size, hwprobe::config::kDefaultRamDiskSize);
}

TEST(DriverConfigTest, KindNamesRoundTrip) {
  for (auto kind : {DriverKind::kVirtioNet, DriverKind::kIxgbe,
                    DriverKind::kIgb, DriverKind::kVirtioBlk,
                    DriverKind::kRamDisk, DriverKind::kBcm2835Sdhci,
                    DriverKind::kVirtioGpu}) {
    auto found = FindDriverKind(GetDriverKindName(kind));
    ASSERT_TRUE(found.has_value()) << GetDriverKindName(kind);
    EXPECT_EQ(found.value(), kind);
  }

  EXPECT_STREQ(GetDriverKindName(DriverKind::kIxgbe), "ixgbe");
  EXPECT_EQ(GetDriverKindClass(DriverKind::kBcm2835Sdhci), DeviceClass::kBlock);
  EXPECT_FALSE(FindDriverKind("e1000").has_value());
  EXPECT_FALSE(FindDriverKind(nullptr).has_value());
}

class DeviceInitTest : public ::testing::Test {
 protected:
  test_env::FakeMemoryService memory_;
  test_env::FakeClock clock_;
  DmaAdapter dma_{memory_, clock_};
  ControllerFactories factories_;
  BoardConfig board_;
};

TEST_F(DeviceInitTest, DriverSetRegistersInConfiguredOrder) {
  DriverConfig config;
  config.net.push_back(DriverKind::kIgb);
  config.net.push_back(DriverKind::kIxgbe);
  config.block.push_back(DriverKind::kRamDisk);

  DriverRegistry registry;
  DriverSet drivers(dma_, factories_);
  ASSERT_TRUE(drivers.Build(config, registry).has_value());

  EXPECT_TRUE(registry.IsSealed());
  EXPECT_EQ(drivers.Size(), 3U);
  const auto& net = registry.GetDrivers(DeviceClass::kNet);
  ASSERT_EQ(net.size(), 2U);
  EXPECT_STREQ(net[0].probe->GetName(), "igb");
  EXPECT_STREQ(net[1].probe->GetName(), "ixgbe");
  EXPECT_STREQ(registry.GetDrivers(DeviceClass::kBlock)[0].probe->GetName(),
               "ramdisk");
}

TEST_F(DeviceInitTest, KindInWrongClassIsRejected) {
  DriverConfig config;
  config.net.push_back(DriverKind::kRamDisk);

  DriverRegistry registry;
  DriverSet drivers(dma_, factories_);
  auto result = drivers.Build(config, registry);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kDriverClassMismatch);
  EXPECT_FALSE(registry.IsSealed());

  auto init = DeviceInit(config, board_, factories_, dma_, nullptr);
  ASSERT_FALSE(init.has_value());
  EXPECT_EQ(init.error().code, ErrorCode::kDriverClassMismatch);
}

TEST_F(DeviceInitTest, RamDiskOnlyConfiguration) {
  DriverConfig config;
  config.block.push_back(DriverKind::kRamDisk);
  config.ramdisk_size = 64 * 1024;

  auto devices = DeviceInit(config, board_, factories_, dma_, nullptr);
  ASSERT_TRUE(devices.has_value()) << devices.error().message();
  EXPECT_EQ(devices->Count(), 1U);
  ASSERT_EQ(devices->Count(DeviceClass::kBlock), 1U);
  EXPECT_EQ(devices->Get(DeviceClass::kBlock)[0].AsBlock()->GetBlockCount(),
            128U);
}

TEST_F(DeviceInitTest, FullDiscoveryAcrossAllBuses) {
  test_env::StubVirtioFactory<BlockDriverOps> virtio_blk("vda");
  test_env::StubVirtioFactory<NetDriverOps> virtio_net("eth1");
  test_env::StubControllerFactory<NetDriverOps> ixgbe("eth0");
  factories_.virtio_blk = &virtio_blk;
  factories_.virtio_net = &virtio_net;
  factories_.ixgbe = &ixgbe;

  DriverConfig config = DriverConfig::Default();
  config.net.push_back(DriverKind::kIxgbe);
  config.block.push_back(DriverKind::kRamDisk);
  config.ramdisk_size = 4096;

  test_env::FakeVirtioMmio blk_slot(2);
  test_env::FakeVirtioMmio empty_slot(0);
  ASSERT_TRUE(
      board_.AddRegion({blk_slot.Region(), DriverFamily::kVirtio}).has_value());
  ASSERT_TRUE(board_.AddRegion({empty_slot.Region(), DriverFamily::kVirtio})
                  .has_value());

  test_env::FakePciRoot pci;
  pci.AddFunction({0, 2, 0},
                  {.vendor_id = 0x8086,
                   .device_id = 0x10FB,
                   .class_code = 0x02,
                   .subclass = 0x00},
                  BarInfo{MemoryBar{.address = 0xFE00'0000,
                                    .size = 0x8'0000,
                                    .prefetchable = false,
                                    .is_64bit = true}});
  pci.AddFunction({0, 3, 0},
                  {.vendor_id = 0x1AF4,
                   .device_id = 0x1000,
                   .class_code = 0x02,
                   .subclass = 0x00},
                  BarInfo{IoBar{.port = 0xC000, .size = 0x20}});

  auto devices = DeviceInit(config, board_, factories_, dma_, &pci);
  ASSERT_TRUE(devices.has_value()) << devices.error().message();

  // 网络：virtio-net 注册在前，但 PCI 顺序决定绑定顺序
  const auto& net = devices->Get(DeviceClass::kNet);
  ASSERT_EQ(net.size(), 2U);
  EXPECT_STREQ(net[0].GetName(), "eth0");
  EXPECT_STREQ(net[1].GetName(), "eth1");

  // 块：ramdisk 在全局探测阶段，virtio-blk 在 MMIO 阶段
  const auto& block = devices->Get(DeviceClass::kBlock);
  ASSERT_EQ(block.size(), 2U);
  EXPECT_STREQ(block[0].GetName(), "ramdisk");
  EXPECT_STREQ(block[1].GetName(), "vda");

  // virtio-gpu 没有控制器实现
  EXPECT_EQ(devices->Count(DeviceClass::kDisplay), 0U);
  EXPECT_EQ(virtio_blk.mmio_calls, 1U);
  EXPECT_EQ(virtio_net.pci_calls, 1U);
}
