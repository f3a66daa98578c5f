/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "driver_registry.hpp"

#include "kernel_log.hpp"

auto DriverRegistry::Register(DriverProbe& probe) -> Expected<void> {
  return Register(probe.GetClass(), probe);
}

auto DriverRegistry::Register(DeviceClass device_class, DriverProbe& probe)
    -> Expected<void> {
  if (sealed_) {
    klog::Err("DriverRegistry: '%s' registered after seal\n", probe.GetName());
    return std::unexpected(Error(ErrorCode::kRegistrySealed));
  }

  if (probe.GetClass() != device_class) {
    klog::Err("DriverRegistry: '%s' is a %s driver, not %s\n", probe.GetName(),
              GetDeviceClassName(probe.GetClass()),
              GetDeviceClassName(device_class));
    return std::unexpected(Error(ErrorCode::kDriverClassMismatch));
  }

  if (Contains(probe)) {
    return std::unexpected(Error(ErrorCode::kDriverAlreadyRegistered));
  }

  auto& list = drivers_[ToIndex(device_class)];
  if (list.full()) {
    klog::Err("DriverRegistry: %s driver list full, '%s' dropped\n",
              GetDeviceClassName(device_class), probe.GetName());
    return std::unexpected(Error(ErrorCode::kRegistryFull));
  }

  list.push_back(DriverEntry{.device_class = device_class, .probe = &probe});
  klog::Debug("DriverRegistry: registered %s driver '%s' (#%zu)\n",
              GetDeviceClassName(device_class), probe.GetName(), list.size());
  return {};
}

auto DriverRegistry::Count() const -> size_t {
  size_t total = 0;
  for (const auto& list : drivers_) {
    total += list.size();
  }
  return total;
}

auto DriverRegistry::Contains(const DriverProbe& probe) const -> bool {
  bool found = false;
  ForEach([&probe, &found](const DriverEntry& entry) -> bool {
    found = entry.probe == &probe;
    return !found;
  });
  return found;
}
