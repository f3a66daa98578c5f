/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "device_handle.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "mocks/stub_drivers.hpp"

using test_env::StubBlockOps;
using test_env::StubDisplayOps;
using test_env::StubNetOps;

static_assert(!std::is_copy_constructible_v<DeviceHandle>);
static_assert(std::is_nothrow_move_constructible_v<DeviceHandle>);
static_assert(!std::is_default_constructible_v<DeviceHandle>);

TEST(DeviceHandleTest, NetHandleExposesOnlyNetView) {
  auto handle = DeviceHandle::FromNet(std::make_unique<StubNetOps>("eth0"));

  EXPECT_EQ(handle.GetClass(), DeviceClass::kNet);
  EXPECT_STREQ(handle.GetName(), "eth0");
  ASSERT_NE(handle.AsNet(), nullptr);
  EXPECT_EQ(handle.AsBlock(), nullptr);
  EXPECT_EQ(handle.AsDisplay(), nullptr);
  EXPECT_EQ(handle.AsNet()->GetMacAddress()[0], 0x52);
}

TEST(DeviceHandleTest, BlockHandleExposesOnlyBlockView) {
  auto handle = DeviceHandle::FromBlock(std::make_unique<StubBlockOps>("sd0"));

  EXPECT_EQ(handle.GetClass(), DeviceClass::kBlock);
  EXPECT_EQ(handle.AsNet(), nullptr);
  ASSERT_NE(handle.AsBlock(), nullptr);
  EXPECT_EQ(handle.AsBlock()->GetBlockSize(), 512U);
}

TEST(DeviceHandleTest, DisplayHandleExposesOnlyDisplayView) {
  auto handle =
      DeviceHandle::FromDisplay(std::make_unique<StubDisplayOps>("fb0"));

  EXPECT_EQ(handle.GetClass(), DeviceClass::kDisplay);
  ASSERT_NE(handle.AsDisplay(), nullptr);
  EXPECT_EQ(handle.AsDisplay()->GetInfo().width, 1280U);
  EXPECT_EQ(handle.AsBlock(), nullptr);
}

TEST(DeviceHandleTest, FromOverloadPicksClassByInterface) {
  std::unique_ptr<BlockDriverOps> block = std::make_unique<StubBlockOps>("b");
  std::unique_ptr<DisplayDriverOps> display =
      std::make_unique<StubDisplayOps>("d");

  EXPECT_EQ(DeviceHandle::From(std::move(block)).GetClass(),
            DeviceClass::kBlock);
  EXPECT_EQ(DeviceHandle::From(std::move(display)).GetClass(),
            DeviceClass::kDisplay);
}

TEST(DeviceHandleTest, MoveTransfersDriverOwnership) {
  auto driver = std::make_unique<StubNetOps>("eth0");
  auto* raw = driver.get();
  auto handle = DeviceHandle::FromNet(std::move(driver));

  std::vector<DeviceHandle> handles;
  handles.push_back(std::move(handle));

  EXPECT_EQ(handles.front().AsNet(), raw);
  EXPECT_EQ(handles.front().AsBase(), raw);
}

TEST(DeviceHandleTest, MovedFromHandleHasNoDriver) {
  auto handle = DeviceHandle::FromBlock(std::make_unique<StubBlockOps>("sd0"));
  auto taken = std::move(handle);

  // NOLINTNEXTLINE(bugprone-use-after-move)
  EXPECT_EQ(handle.AsBase(), nullptr);
  EXPECT_STREQ(handle.GetName(), "");
  EXPECT_STREQ(taken.GetName(), "sd0");
}

TEST(DeviceHandleTest, VariantSupportsExhaustiveVisit) {
  auto handle = DeviceHandle::FromBlock(std::make_unique<StubBlockOps>("sd0"));

  int visited = 0;
  std::visit(
      [&visited](const auto& device) {
        using T = std::decay_t<decltype(device)>;
        if constexpr (std::is_same_v<T, BlockDevice>) {
          visited = 2;
        } else {
          visited = 1;
        }
      },
      handle.Get());
  EXPECT_EQ(visited, 2);
}

TEST(DeviceClassTest, NamesAndIndices) {
  EXPECT_STREQ(GetDeviceClassName(DeviceClass::kNet), "net");
  EXPECT_STREQ(GetDeviceClassName(DeviceClass::kBlock), "block");
  EXPECT_STREQ(GetDeviceClassName(DeviceClass::kDisplay), "display");
  EXPECT_EQ(ToIndex(DeviceClass::kNet), 0U);
  EXPECT_EQ(ToIndex(DeviceClass::kDisplay), kDeviceClassCount - 1);
}
