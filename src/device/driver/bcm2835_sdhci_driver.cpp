/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "driver/bcm2835_sdhci_driver.hpp"

#include "kernel_log.hpp"

auto Bcm2835SdhciDriver::ProbeGlobal() -> ProbeResult {
  if (factory_ == nullptr) {
    klog::Debug("Bcm2835SdhciDriver: no controller implementation\n");
    return std::nullopt;
  }

  auto regs = dma_.MapRegisterWindow(region_);
  if (!regs.IsValid()) {
    klog::Warn("Bcm2835SdhciDriver: invalid register region 0x%lX+0x%zX\n",
               region_.base, region_.size);
    return std::nullopt;
  }

  auto sdhci = factory_->Create(std::move(regs), dma_);
  if (!sdhci.has_value()) {
    klog::Err("Bcm2835SdhciDriver: initialization at 0x%lX failed: %s\n",
              region_.base, sdhci.error().message());
    return ProbeResult::Failed(sdhci.error());
  }
  if (*sdhci == nullptr) {
    return ProbeResult::Failed(Error(ErrorCode::kDeviceInitFailed));
  }

  klog::Info("Bcm2835SdhciDriver: controller at 0x%lX ready\n", region_.base);
  return DeviceHandle::FromBlock(std::move(*sdhci));
}
