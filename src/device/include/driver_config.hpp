/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 驱动选择与控制器工厂配置
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_CONFIG_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_CONFIG_HPP_

#include <etl/vector.h>

#include <cstddef>
#include <cstdint>

#include "bus_descriptor.hpp"
#include "driver/bcm2835_sdhci_driver.hpp"
#include "driver/controller_factory.hpp"
#include "driver_ops.hpp"
#include "expected.hpp"
#include "hwprobe_config.hpp"

/// 可选驱动
enum class DriverKind : uint8_t {
  kVirtioNet,
  kIxgbe,
  kIgb,
  kVirtioBlk,
  kRamDisk,
  kBcm2835Sdhci,
  kVirtioGpu,
  kDriverKindMax,
};

/// 驱动名称，与 DriverProbe::GetName() 一致
[[nodiscard]] auto GetDriverKindName(DriverKind kind) -> const char*;

/// 驱动产出的设备类别
[[nodiscard]] auto GetDriverKindClass(DriverKind kind) -> DeviceClass;

/**
 * @brief 按名称查找驱动
 * @return Expected<DriverKind> 未知名称返回 kInvalidArgument
 */
[[nodiscard]] auto FindDriverKind(const char* name) -> Expected<DriverKind>;

/**
 * @brief 驱动配置
 *
 * 每个类别一个有序列表，顺序即优先级。
 */
struct DriverConfig {
  using KindList = etl::vector<DriverKind, hwprobe::config::kMaxDriversPerClass>;

  KindList net;
  KindList block;
  KindList display;

  size_t ramdisk_size{hwprobe::config::kDefaultRamDiskSize};
  MmioRegion sdhci_region{Bcm2835SdhciDriver::kDefaultBase,
                          Bcm2835SdhciDriver::kDefaultSize};

  [[nodiscard]] auto GetKinds(DeviceClass device_class) const
      -> const KindList&;

  [[nodiscard]] auto GetKinds(DeviceClass device_class) -> KindList&;

  /// virtio-net、virtio-blk、virtio-gpu
  [[nodiscard]] static auto Default() -> DriverConfig;
};

/// 外部提供的控制器实现，nullptr 表示不可用
struct ControllerFactories {
  ControllerFactory<NetDriverOps>* ixgbe{nullptr};
  ControllerFactory<NetDriverOps>* igb{nullptr};
  ControllerFactory<BlockDriverOps>* bcm2835_sdhci{nullptr};
  VirtioTransportFactory<NetDriverOps>* virtio_net{nullptr};
  VirtioTransportFactory<BlockDriverOps>* virtio_blk{nullptr};
  VirtioTransportFactory<DisplayDriverOps>* virtio_gpu{nullptr};
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_CONFIG_HPP_
