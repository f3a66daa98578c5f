/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 驱动探测接口
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_PROBE_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <utility>

#include "bus_descriptor.hpp"
#include "device_handle.hpp"
#include "driver_ops.hpp"
#include "expected.hpp"
#include "pci_root.hpp"

/// 板级 MMIO 区域所属的驱动族
enum class DriverFamily : uint8_t {
  /// 不在固定 MMIO 区域上
  kNone,
  /// virtio-mmio 传输
  kVirtio,
};

/**
 * @brief 探测结果
 *
 * 三种状态：不匹配、产出设备句柄、已认领但初始化失败。
 * 被认领的设备（无论成败）不再交给后续驱动。
 */
class ProbeResult {
 public:
  /// 不匹配
  ProbeResult(std::nullopt_t) {}  // NOLINT(google-explicit-constructor)

  /// 产出设备
  ProbeResult(DeviceHandle handle)  // NOLINT(google-explicit-constructor)
      : handle_(std::move(handle)) {}

  /**
   * @brief 驱动已认领设备但硬件初始化失败
   * @param  error          失败原因
   */
  [[nodiscard]] static auto Failed(Error error) -> ProbeResult {
    ProbeResult result(std::nullopt);
    result.error_ = error;
    return result;
  }

  /// 是否产出了设备句柄
  [[nodiscard]] auto has_value() const -> bool { return handle_.has_value(); }

  [[nodiscard]] auto IsFailed() const -> bool { return error_.has_value(); }

  /// 设备是否被该驱动认领
  [[nodiscard]] auto IsClaimed() const -> bool {
    return has_value() || IsFailed();
  }

  /// @pre IsFailed()
  [[nodiscard]] auto error() const -> const Error& { return *error_; }

  /// @pre has_value()
  auto operator*() -> DeviceHandle& { return *handle_; }
  auto operator*() const -> const DeviceHandle& { return *handle_; }
  auto operator->() -> DeviceHandle* { return &*handle_; }
  auto operator->() const -> const DeviceHandle* { return &*handle_; }

 private:
  std::optional<DeviceHandle> handle_;
  std::optional<Error> error_;
};

/**
 * @brief 驱动探测接口
 *
 * 每个驱动按自己的发现方式只覆盖部分操作，其余保持默认的"不匹配"，
 * 这样 DeviceManager 可以在所有发现方式上统一尝试同一个驱动。
 * 不匹配不是错误；匹配后硬件初始化失败时驱动记录日志并返回
 * ProbeResult::Failed()，该设备不再重试。
 */
class DriverProbe {
 public:
  virtual ~DriverProbe() = default;

  /// 驱动名称（用于日志）
  [[nodiscard]] virtual auto GetName() const -> const char* = 0;

  /// 驱动产出的设备类别
  [[nodiscard]] virtual auto GetClass() const -> DeviceClass = 0;

  /// 驱动服务的板级 MMIO 区域族
  [[nodiscard]] virtual auto GetFamily() const -> DriverFamily {
    return DriverFamily::kNone;
  }

  /**
   * @brief 探测不在任何总线上的设备（如 RAM disk）
   */
  virtual auto ProbeGlobal() -> ProbeResult { return std::nullopt; }

  /**
   * @brief 在固定 MMIO 区域上探测
   * @param  region         板级配置的物理区域
   */
  virtual auto ProbeMmio([[maybe_unused]] const MmioRegion& region)
      -> ProbeResult {
    return std::nullopt;
  }

  /**
   * @brief 探测一个 PCI function
   * @param  root           PCI 根总线，可查询其它 BAR
   * @param  device         function 标识、vendor/device 与 BAR0
   */
  virtual auto ProbePci([[maybe_unused]] PciRoot& root,
                        [[maybe_unused]] const PciDeviceDescriptor& device)
      -> ProbeResult {
    return std::nullopt;
  }
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_PROBE_HPP_
