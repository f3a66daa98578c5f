/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "driver_config.hpp"

#include <cstring>

namespace {

struct DriverKindInfo {
  DriverKind kind;
  const char* name;
  DeviceClass device_class;
};

constexpr DriverKindInfo kDriverKinds[] = {
    {DriverKind::kVirtioNet, "virtio-net", DeviceClass::kNet},
    {DriverKind::kIxgbe, "ixgbe", DeviceClass::kNet},
    {DriverKind::kIgb, "igb", DeviceClass::kNet},
    {DriverKind::kVirtioBlk, "virtio-blk", DeviceClass::kBlock},
    {DriverKind::kRamDisk, "ramdisk", DeviceClass::kBlock},
    {DriverKind::kBcm2835Sdhci, "bcm2835-sdhci", DeviceClass::kBlock},
    {DriverKind::kVirtioGpu, "virtio-gpu", DeviceClass::kDisplay},
};

static_assert(sizeof(kDriverKinds) / sizeof(kDriverKinds[0]) ==
              static_cast<size_t>(DriverKind::kDriverKindMax));

}  // namespace

auto GetDriverKindName(DriverKind kind) -> const char* {
  const auto index = static_cast<size_t>(kind);
  if (index >= static_cast<size_t>(DriverKind::kDriverKindMax)) {
    return "unknown";
  }
  return kDriverKinds[index].name;
}

auto GetDriverKindClass(DriverKind kind) -> DeviceClass {
  const auto index = static_cast<size_t>(kind);
  if (index >= static_cast<size_t>(DriverKind::kDriverKindMax)) {
    return DeviceClass::kNet;
  }
  return kDriverKinds[index].device_class;
}

auto FindDriverKind(const char* name) -> Expected<DriverKind> {
  if (name == nullptr) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  for (const auto& info : kDriverKinds) {
    if (std::strcmp(info.name, name) == 0) {
      return info.kind;
    }
  }
  return std::unexpected(Error(ErrorCode::kInvalidArgument));
}

auto DriverConfig::GetKinds(DeviceClass device_class) const
    -> const KindList& {
  switch (device_class) {
    case DeviceClass::kNet:
      return net;
    case DeviceClass::kBlock:
      return block;
    case DeviceClass::kDisplay:
    default:
      return display;
  }
}

auto DriverConfig::GetKinds(DeviceClass device_class) -> KindList& {
  switch (device_class) {
    case DeviceClass::kNet:
      return net;
    case DeviceClass::kBlock:
      return block;
    case DeviceClass::kDisplay:
    default:
      return display;
  }
}

auto DriverConfig::Default() -> DriverConfig {
  DriverConfig config;
  config.net.push_back(DriverKind::kVirtioNet);
  config.block.push_back(DriverKind::kVirtioBlk);
  config.display.push_back(DriverKind::kVirtioGpu);
  return config;
}
