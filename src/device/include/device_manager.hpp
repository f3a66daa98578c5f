/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_MANAGER_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_MANAGER_HPP_

#include <etl/vector.h>

#include <array>
#include <cstddef>

#include "board_config.hpp"
#include "device_handle.hpp"
#include "driver_registry.hpp"
#include "expected.hpp"
#include "hwprobe_config.hpp"
#include "pci_root.hpp"

/**
 * @brief 发现结果：每个设备类别一个有序句柄序列
 */
class BoundDevices {
 public:
  using DeviceList =
      etl::vector<DeviceHandle, hwprobe::config::kMaxDevicesPerClass>;

  /**
   * @brief 按句柄类别追加
   * @return false 该类别已满，句柄被丢弃
   */
  auto Add(DeviceHandle handle) -> bool;

  [[nodiscard]] auto Get(DeviceClass device_class) -> DeviceList& {
    return devices_[ToIndex(device_class)];
  }

  [[nodiscard]] auto Get(DeviceClass device_class) const -> const DeviceList& {
    return devices_[ToIndex(device_class)];
  }

  [[nodiscard]] auto Count(DeviceClass device_class) const -> size_t {
    return devices_[ToIndex(device_class)].size();
  }

  [[nodiscard]] auto Count() const -> size_t;

  [[nodiscard]] auto IsFull(DeviceClass device_class) const -> bool {
    return devices_[ToIndex(device_class)].full();
  }

  auto Clear() -> void;

 private:
  std::array<DeviceList, kDeviceClassCount> devices_{};
};

/// 发现过程统计
struct DiscoveryStats {
  size_t global_bound{0};
  size_t mmio_regions{0};
  size_t mmio_bound{0};
  size_t pci_functions{0};
  size_t pci_bound{0};
  /// 没有驱动匹配或不是普通设备的 function
  size_t pci_skipped{0};
  /// 结果列表已满而丢弃的句柄
  size_t dropped{0};
  /// 驱动认领后初始化失败的设备
  size_t failed{0};
};

/**
 * @brief 设备管理器：按固定顺序执行全局、MMIO、PCI 三轮探测
 *
 * 单个设备的失败只影响该设备，不会中止整个发现过程。
 */
class DeviceManager {
 public:
  /**
   * @brief 构造函数
   * @param  registry       已 Seal() 的驱动注册表
   */
  explicit DeviceManager(const DriverRegistry& registry)
      : registry_(registry) {}

  /**
   * @brief 依次执行全局、MMIO、PCI 探测
   * @param  board          板级 MMIO 区域
   * @param  pci_root       PCI 根总线，nullptr 时跳过 PCI 探测
   * @return Expected<void> 注册表未 Seal 时返回 kRegistryNotSealed
   */
  auto ProbeAll(const BoardConfig& board, PciRoot* pci_root) -> Expected<void>;

  /**
   * @brief 全局探测：对每个已注册驱动调用 ProbeGlobal()
   * @return size_t         本轮绑定的设备数
   */
  auto ProbeGlobal() -> size_t;

  /**
   * @brief MMIO 探测：每个区域按注册顺序尝试同族驱动，首个认领者绑定，
   * 认领后初始化失败的区域不再尝试后续驱动
   * @return size_t         本轮绑定的设备数
   */
  auto ProbeMmio(const BoardConfig& board) -> size_t;

  /**
   * @brief PCI 探测：枚举 function，解析 BAR0，按注册顺序尝试驱动
   * @return Expected<size_t> 本轮绑定的设备数；枚举失败时返回错误
   */
  auto ProbePci(PciRoot& root) -> Expected<size_t>;

  [[nodiscard]] auto GetDevices() const -> const BoundDevices& {
    return devices_;
  }

  /// 移出发现结果
  [[nodiscard]] auto TakeDevices() -> BoundDevices;

  [[nodiscard]] auto GetStats() const -> const DiscoveryStats& {
    return stats_;
  }

  /// @name 构造/析构函数
  /// @{
  DeviceManager() = delete;
  ~DeviceManager() = default;
  DeviceManager(const DeviceManager&) = delete;
  DeviceManager(DeviceManager&&) = delete;
  auto operator=(const DeviceManager&) -> DeviceManager& = delete;
  auto operator=(DeviceManager&&) -> DeviceManager& = delete;
  /// @}

 private:
  /// 保存句柄；结果列表满时丢弃并记录
  auto Bind(DeviceHandle handle, const DriverEntry& entry) -> bool;

  const DriverRegistry& registry_;
  BoundDevices devices_;
  DiscoveryStats stats_;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_MANAGER_HPP_
