/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 驱动注册表
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_REGISTRY_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_REGISTRY_HPP_

#include <etl/vector.h>

#include <array>
#include <cstddef>

#include "driver_ops.hpp"
#include "driver_probe.hpp"
#include "expected.hpp"
#include "hwprobe_config.hpp"

/// 注册项
struct DriverEntry {
  DeviceClass device_class;
  DriverProbe* probe;
};

/**
 * @brief 驱动注册表
 *
 * 每个设备类别一个有序驱动列表，顺序即配置优先级：同一设备可被多个驱动
 * 匹配时，先注册者胜出。探测开始前完成注册并 Seal()，之后只读，
 * 可在任意上下文无锁读取。
 */
class DriverRegistry {
 public:
  using DriverList =
      etl::vector<DriverEntry, hwprobe::config::kMaxDriversPerClass>;

  /**
   * @brief 按驱动自身的类别注册
   * @param  probe          驱动探测实例，生存期须覆盖注册表
   * @return Expected<void> kRegistrySealed / kRegistryFull /
   *                        kDriverAlreadyRegistered
   */
  auto Register(DriverProbe& probe) -> Expected<void>;

  /**
   * @brief 注册到指定类别
   * @return Expected<void> 类别与 probe.GetClass() 不符时返回
   *                        kDriverClassMismatch
   */
  auto Register(DeviceClass device_class, DriverProbe& probe)
      -> Expected<void>;

  /// 冻结注册表，之后 Register() 均失败
  auto Seal() -> void { sealed_ = true; }

  [[nodiscard]] auto IsSealed() const -> bool { return sealed_; }

  /// 获取某类别的有序驱动列表
  [[nodiscard]] auto GetDrivers(DeviceClass device_class) const
      -> const DriverList& {
    return drivers_[ToIndex(device_class)];
  }

  [[nodiscard]] auto Count(DeviceClass device_class) const -> size_t {
    return drivers_[ToIndex(device_class)].size();
  }

  [[nodiscard]] auto Count() const -> size_t;

  /**
   * @brief 按 net、block、display 的类别顺序和注册顺序遍历
   * @param  fn             bool(const DriverEntry&)，返回 false 停止遍历
   */
  template <typename Fn>
  auto ForEach(Fn&& fn) const -> void {
    for (const auto& list : drivers_) {
      for (const auto& entry : list) {
        if (!fn(entry)) {
          return;
        }
      }
    }
  }

  /// @name 构造/析构函数
  /// @{
  DriverRegistry() = default;
  ~DriverRegistry() = default;
  DriverRegistry(const DriverRegistry&) = delete;
  DriverRegistry(DriverRegistry&&) = delete;
  auto operator=(const DriverRegistry&) -> DriverRegistry& = delete;
  auto operator=(DriverRegistry&&) -> DriverRegistry& = delete;
  /// @}

 private:
  [[nodiscard]] auto Contains(const DriverProbe& probe) const -> bool;

  std::array<DriverList, kDeviceClassCount> drivers_{};
  bool sealed_{false};
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_REGISTRY_HPP_
