/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "device_manager.hpp"

#include <algorithm>
#include <utility>

#include "kernel_log.hpp"

auto BoundDevices::Add(DeviceHandle handle) -> bool {
  auto& list = devices_[ToIndex(handle.GetClass())];
  if (list.full()) {
    return false;
  }
  list.push_back(std::move(handle));
  return true;
}

auto BoundDevices::Count() const -> size_t {
  size_t total = 0;
  for (const auto& list : devices_) {
    total += list.size();
  }
  return total;
}

auto BoundDevices::Clear() -> void {
  for (auto& list : devices_) {
    list.clear();
  }
}

auto DeviceManager::ProbeAll(const BoardConfig& board, PciRoot* pci_root)
    -> Expected<void> {
  if (!registry_.IsSealed()) {
    klog::Err("DeviceManager: registry must be sealed before probing\n");
    return std::unexpected(Error(ErrorCode::kRegistryNotSealed));
  }

  klog::Info("DeviceManager: %zu driver(s) registered (net %zu, block %zu, "
             "display %zu)\n",
             registry_.Count(), registry_.Count(DeviceClass::kNet),
             registry_.Count(DeviceClass::kBlock),
             registry_.Count(DeviceClass::kDisplay));

  ProbeGlobal();
  ProbeMmio(board);

  if (pci_root != nullptr) {
    auto pci_result = ProbePci(*pci_root);
    if (!pci_result.has_value()) {
      // PCI 枚举失败不影响已经绑定的设备
      klog::Err("DeviceManager: bus '%s' probing failed: %s\n",
                pci_root->GetName(), pci_result.error().message());
    }
  }

  klog::Info("DeviceManager: bound %zu device(s): net %zu, block %zu, "
             "display %zu\n",
             devices_.Count(), devices_.Count(DeviceClass::kNet),
             devices_.Count(DeviceClass::kBlock),
             devices_.Count(DeviceClass::kDisplay));
  return {};
}

auto DeviceManager::ProbeGlobal() -> size_t {
  size_t bound = 0;
  registry_.ForEach([this, &bound](const DriverEntry& entry) -> bool {
    auto result = entry.probe->ProbeGlobal();
    if (result.IsFailed()) {
      ++stats_.failed;
    } else if (result.has_value() && Bind(std::move(*result), entry)) {
      ++bound;
    }
    return true;
  });

  stats_.global_bound += bound;
  klog::Debug("DeviceManager: global probing bound %zu device(s)\n", bound);
  return bound;
}

auto DeviceManager::ProbeMmio(const BoardConfig& board) -> size_t {
  size_t bound = 0;
  for (const auto& board_region : board.GetRegions()) {
    ++stats_.mmio_regions;
    if (board_region.family == DriverFamily::kNone) {
      continue;
    }

    bool matched = false;
    registry_.ForEach([&](const DriverEntry& entry) -> bool {
      if (entry.probe->GetFamily() != board_region.family) {
        return true;
      }
      auto result = entry.probe->ProbeMmio(board_region.region);
      if (!result.IsClaimed()) {
        return true;
      }
      matched = true;
      if (result.IsFailed()) {
        ++stats_.failed;
      } else if (Bind(std::move(*result), entry)) {
        ++bound;
      }
      return false;
    });

    if (!matched) {
      klog::Debug("DeviceManager: no driver at mmio 0x%lX size 0x%zX\n",
                  board_region.region.base, board_region.region.size);
    }
  }

  stats_.mmio_bound += bound;
  klog::Debug("DeviceManager: mmio probing bound %zu device(s)\n", bound);
  return bound;
}

auto DeviceManager::ProbePci(PciRoot& root) -> Expected<size_t> {
  std::array<PciFunction, hwprobe::config::kMaxPciFunctions> functions{};
  auto enumerated = root.Enumerate(functions.data(), functions.size());
  if (!enumerated.has_value()) {
    return std::unexpected(enumerated.error());
  }

  const size_t count = std::min(enumerated.value(), functions.size());
  if (count < enumerated.value()) {
    klog::Warn("DeviceManager: bus '%s' reported %zu function(s), only %zu "
               "probed\n",
               root.GetName(), enumerated.value(), count);
  }
  size_t bound = 0;
  for (size_t i = 0; i < count; ++i) {
    const auto& function = functions[i];
    const auto& bdf = function.id;
    ++stats_.pci_functions;

    if (function.info.header_type != PciHeaderType::kStandard) {
      klog::Debug("DeviceManager: %02x:%02x.%u is a bridge, skipped\n",
                  bdf.bus, bdf.device, bdf.function);
      ++stats_.pci_skipped;
      continue;
    }

    auto bar0 = root.GetBarInfo(bdf, 0);
    if (!bar0.has_value()) {
      klog::Warn("DeviceManager: %02x:%02x.%u [%04x:%04x] BAR0: %s\n",
                 bdf.bus, bdf.device, bdf.function, function.info.vendor_id,
                 function.info.device_id, bar0.error().message());
      ++stats_.pci_skipped;
      continue;
    }

    const PciDeviceDescriptor device{
        .function = bdf,
        .info = function.info,
        .bar0 = bar0.value(),
    };

    bool matched = false;
    registry_.ForEach([&](const DriverEntry& entry) -> bool {
      auto result = entry.probe->ProbePci(root, device);
      if (!result.IsClaimed()) {
        return true;
      }
      // 认领后初始化失败的 function 不再交给其它驱动
      matched = true;
      if (result.IsFailed()) {
        ++stats_.failed;
      } else if (Bind(std::move(*result), entry)) {
        ++bound;
      }
      return false;
    });

    if (!matched) {
      klog::Debug("DeviceManager: no driver for %02x:%02x.%u [%04x:%04x]\n",
                  bdf.bus, bdf.device, bdf.function, function.info.vendor_id,
                  function.info.device_id);
      ++stats_.pci_skipped;
    }
  }

  stats_.pci_bound += bound;
  klog::Info("DeviceManager: bus '%s' scanned %zu function(s), bound %zu\n",
             root.GetName(), count, bound);
  return bound;
}

auto DeviceManager::TakeDevices() -> BoundDevices {
  BoundDevices out = std::move(devices_);
  devices_.Clear();
  return out;
}

auto DeviceManager::Bind(DeviceHandle handle, const DriverEntry& entry)
    -> bool {
  const auto device_class = handle.GetClass();
  if (device_class != entry.device_class) {
    klog::Warn("DeviceManager: '%s' produced a %s device, expected %s\n",
               entry.probe->GetName(), GetDeviceClassName(device_class),
               GetDeviceClassName(entry.device_class));
  }

  const char* name = handle.GetName();
  if (devices_.IsFull(device_class)) {
    klog::Warn("DeviceManager: %s device list full, '%s' dropped\n",
               GetDeviceClassName(device_class), name);
    ++stats_.dropped;
    return false;
  }

  // 句柄移交后 name 仍指向驱动对象内部
  if (!devices_.Add(std::move(handle))) {
    return false;
  }
  klog::Info("DeviceManager: '%s' bound to '%s'\n", name,
             entry.probe->GetName());
  return true;
}
