/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief BCM2835 SDHCI 驱动
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_BCM2835_SDHCI_DRIVER_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_BCM2835_SDHCI_DRIVER_HPP_

#include <cstddef>
#include <cstdint>

#include "bus_descriptor.hpp"
#include "dma_adapter.hpp"
#include "driver/controller_factory.hpp"
#include "driver_ops.hpp"
#include "driver_probe.hpp"

/**
 * @brief BCM2835 SD 主控制器驱动
 *
 * 控制器位于板级固定地址，没有可枚举的总线，因此在全局探测阶段
 * 直接尝试初始化；初始化失败即认为板上不存在该控制器。
 */
class Bcm2835SdhciDriver final : public DriverProbe {
 public:
  /// Raspberry Pi 4 EMMC2 控制器
  static constexpr uint64_t kDefaultBase = 0xFE34'0000;
  static constexpr size_t kDefaultSize = 0x100;

  /**
   * @brief 构造函数
   * @param  region         控制器寄存器的物理区域
   * @param  dma            DMA 适配器
   * @param  factory        控制器初始化实现，nullptr 表示不支持
   */
  Bcm2835SdhciDriver(const MmioRegion& region, DmaAdapter& dma,
                     ControllerFactory<BlockDriverOps>* factory)
      : region_(region), dma_(dma), factory_(factory) {}

  [[nodiscard]] auto GetName() const -> const char* override {
    return "bcm2835-sdhci";
  }

  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return DeviceClass::kBlock;
  }

  auto ProbeGlobal() -> ProbeResult override;

  [[nodiscard]] auto GetRegion() const -> const MmioRegion& { return region_; }

 private:
  MmioRegion region_;
  DmaAdapter& dma_;
  ControllerFactory<BlockDriverOps>* factory_;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_BCM2835_SDHCI_DRIVER_HPP_
