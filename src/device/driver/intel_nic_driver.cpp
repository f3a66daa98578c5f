/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "driver/intel_nic_driver.hpp"

#include <variant>

#include "kernel_log.hpp"

auto PciNicDriver::Matches(const PciFunctionInfo& info) const -> bool {
  for (const auto& key : match_table_) {
    if (key.Matches(info)) {
      return true;
    }
  }
  return false;
}

auto PciNicDriver::ProbePci([[maybe_unused]] PciRoot& root,
                            const PciDeviceDescriptor& device) -> ProbeResult {
  if (!Matches(device.info)) {
    return std::nullopt;
  }

  const auto& id = device.function;
  klog::Info("%s: found %04x:%04x at %02x:%02x.%u\n", name_,
             device.info.vendor_id, device.info.device_id, id.bus, id.device,
             id.function);

  const auto* bar = std::get_if<MemoryBar>(&device.bar0);
  if (bar == nullptr) {
    klog::Info("%s: BAR0 of %02x:%02x.%u is of I/O type\n", name_, id.bus,
               id.device, id.function);
    return std::nullopt;
  }

  if (factory_ == nullptr) {
    klog::Warn("%s: no controller implementation\n", name_);
    return std::nullopt;
  }

  auto regs = dma_.MapRegisterWindow(
      MmioRegion{.base = bar->address, .size = static_cast<size_t>(bar->size)});
  if (!regs.IsValid()) {
    klog::Err("%s: BAR0 of %02x:%02x.%u is not assigned\n", name_, id.bus,
              id.device, id.function);
    return ProbeResult::Failed(Error(ErrorCode::kPciBarNotPresent));
  }

  auto nic = factory_->Create(std::move(regs), dma_);
  if (!nic.has_value()) {
    klog::Err("%s: initialization of %02x:%02x.%u failed: %s\n", name_, id.bus,
              id.device, id.function, nic.error().message());
    return ProbeResult::Failed(nic.error());
  }
  if (*nic == nullptr) {
    return ProbeResult::Failed(Error(ErrorCode::kDeviceInitFailed));
  }

  return DeviceHandle::FromNet(std::move(*nic));
}
