/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "device_handle.hpp"

#include <cassert>
#include <type_traits>

auto DeviceHandle::FromNet(std::unique_ptr<NetDriverOps> driver)
    -> DeviceHandle {
  assert(driver != nullptr && "FromNet: driver must not be null");
  return DeviceHandle(NetDevice{std::move(driver)});
}

auto DeviceHandle::FromBlock(std::unique_ptr<BlockDriverOps> driver)
    -> DeviceHandle {
  assert(driver != nullptr && "FromBlock: driver must not be null");
  return DeviceHandle(BlockDevice{std::move(driver)});
}

auto DeviceHandle::FromDisplay(std::unique_ptr<DisplayDriverOps> driver)
    -> DeviceHandle {
  assert(driver != nullptr && "FromDisplay: driver must not be null");
  return DeviceHandle(DisplayDevice{std::move(driver)});
}

auto DeviceHandle::GetClass() const -> DeviceClass {
  return std::visit(
      [](const auto& dev) -> DeviceClass {
        using T = std::decay_t<decltype(dev)>;
        if constexpr (std::is_same_v<T, NetDevice>) {
          return DeviceClass::kNet;
        } else if constexpr (std::is_same_v<T, BlockDevice>) {
          return DeviceClass::kBlock;
        } else {
          return DeviceClass::kDisplay;
        }
      },
      device_);
}

auto DeviceHandle::GetName() const -> const char* {
  const auto* base = AsBase();
  return base != nullptr ? base->GetName() : "";
}

auto DeviceHandle::AsNet() const -> NetDriverOps* {
  const auto* dev = std::get_if<NetDevice>(&device_);
  return dev != nullptr ? dev->driver.get() : nullptr;
}

auto DeviceHandle::AsBlock() const -> BlockDriverOps* {
  const auto* dev = std::get_if<BlockDevice>(&device_);
  return dev != nullptr ? dev->driver.get() : nullptr;
}

auto DeviceHandle::AsDisplay() const -> DisplayDriverOps* {
  const auto* dev = std::get_if<DisplayDevice>(&device_);
  return dev != nullptr ? dev->driver.get() : nullptr;
}

auto DeviceHandle::AsBase() const -> BaseDriverOps* {
  return std::visit(
      [](const auto& dev) -> BaseDriverOps* { return dev.driver.get(); },
      device_);
}
