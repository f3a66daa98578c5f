/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 设备初始化入口
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_INIT_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_INIT_HPP_

#include <etl/vector.h>

#include <cstddef>
#include <memory>

#include "board_config.hpp"
#include "device_manager.hpp"
#include "dma_adapter.hpp"
#include "driver_config.hpp"
#include "driver_probe.hpp"
#include "driver_registry.hpp"
#include "expected.hpp"
#include "hwprobe_config.hpp"
#include "pci_root.hpp"

/**
 * @brief 按配置创建的驱动实例集合
 *
 * 持有所有探测实例，生存期须覆盖使用它的 DriverRegistry。
 */
class DriverSet {
 public:
  static constexpr size_t kMaxDrivers =
      hwprobe::config::kMaxDriversPerClass * kDeviceClassCount;

  DriverSet(DmaAdapter& dma, const ControllerFactories& factories)
      : dma_(dma), factories_(factories) {}

  /**
   * @brief 按配置顺序创建驱动、注册并 Seal()
   * @return Expected<void> 驱动放错类别时返回 kDriverClassMismatch，
   *                        其余为 Register() 的错误
   */
  auto Build(const DriverConfig& config, DriverRegistry& registry)
      -> Expected<void>;

  [[nodiscard]] auto Size() const -> size_t { return probes_.size(); }

  /// @name 构造/析构函数
  /// @{
  DriverSet() = delete;
  ~DriverSet() = default;
  DriverSet(const DriverSet&) = delete;
  DriverSet(DriverSet&&) = delete;
  auto operator=(const DriverSet&) -> DriverSet& = delete;
  auto operator=(DriverSet&&) -> DriverSet& = delete;
  /// @}

 private:
  /// 需要控制器工厂的驱动是否已提供工厂
  [[nodiscard]] auto HasController(DriverKind kind) const -> bool;

  auto Create(DriverKind kind, const DriverConfig& config)
      -> std::unique_ptr<DriverProbe>;

  DmaAdapter& dma_;
  ControllerFactories factories_;
  etl::vector<std::unique_ptr<DriverProbe>, kMaxDrivers> probes_;
};

/**
 * @brief 设备初始化：注册配置的驱动，执行全部探测
 *
 * @param  config         驱动选择
 * @param  board          板级 MMIO 区域
 * @param  factories      控制器实现
 * @param  dma            DMA 适配器，生存期须覆盖返回的设备
 * @param  pci_root       PCI 根总线，nullptr 表示没有 PCI
 * @return Expected<BoundDevices> 仅在配置错误时失败
 */
[[nodiscard]] auto DeviceInit(const DriverConfig& config,
                              const BoardConfig& board,
                              const ControllerFactories& factories,
                              DmaAdapter& dma, PciRoot* pci_root)
    -> Expected<BoundDevices>;

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_INIT_HPP_
