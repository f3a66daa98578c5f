/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 已绑定设备的统一句柄
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_HANDLE_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_HANDLE_HPP_

#include <memory>
#include <utility>
#include <variant>

#include "driver_ops.hpp"

/// 网络设备，独占一个驱动实例
struct NetDevice {
  std::unique_ptr<NetDriverOps> driver;
};

/// 块设备，独占一个驱动实例
struct BlockDevice {
  std::unique_ptr<BlockDriverOps> driver;
};

/// 显示设备，独占一个驱动实例
struct DisplayDevice {
  std::unique_ptr<DisplayDriverOps> driver;
};

/**
 * @brief 设备句柄：探测成功时创建，按类别封装一个驱动实例
 *
 * 类别在构造后不可变；句柄只能移动，驱动实例的所有权随句柄转移。
 */
class DeviceHandle {
 public:
  using Storage = std::variant<NetDevice, BlockDevice, DisplayDevice>;

  /// @pre driver != nullptr
  static auto FromNet(std::unique_ptr<NetDriverOps> driver) -> DeviceHandle;
  /// @pre driver != nullptr
  static auto FromBlock(std::unique_ptr<BlockDriverOps> driver)
      -> DeviceHandle;
  /// @pre driver != nullptr
  static auto FromDisplay(std::unique_ptr<DisplayDriverOps> driver)
      -> DeviceHandle;

  /// 按驱动接口类型重载，便于模板驱动统一构造
  static auto From(std::unique_ptr<NetDriverOps> driver) -> DeviceHandle {
    return FromNet(std::move(driver));
  }
  static auto From(std::unique_ptr<BlockDriverOps> driver) -> DeviceHandle {
    return FromBlock(std::move(driver));
  }
  static auto From(std::unique_ptr<DisplayDriverOps> driver) -> DeviceHandle {
    return FromDisplay(std::move(driver));
  }

  [[nodiscard]] auto GetClass() const -> DeviceClass;

  /// 设备名称，转发给驱动实例；句柄已被移出时返回空串
  [[nodiscard]] auto GetName() const -> const char*;

  /// @return 类别不符时返回 nullptr
  [[nodiscard]] auto AsNet() const -> NetDriverOps*;
  [[nodiscard]] auto AsBlock() const -> BlockDriverOps*;
  [[nodiscard]] auto AsDisplay() const -> DisplayDriverOps*;

  /// 以 BaseDriverOps 访问任意类别的驱动，句柄已被移出时返回 nullptr
  [[nodiscard]] auto AsBase() const -> BaseDriverOps*;

  /// 底层 variant，供调用方穷举匹配
  [[nodiscard]] auto Get() const -> const Storage& { return device_; }

  /// @name 构造/析构函数
  /// @{
  DeviceHandle() = delete;
  ~DeviceHandle() = default;
  DeviceHandle(const DeviceHandle&) = delete;
  DeviceHandle(DeviceHandle&&) noexcept = default;
  auto operator=(const DeviceHandle&) -> DeviceHandle& = delete;
  auto operator=(DeviceHandle&&) noexcept -> DeviceHandle& = default;
  /// @}

 private:
  explicit DeviceHandle(Storage device) : device_(std::move(device)) {}

  Storage device_;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DEVICE_HANDLE_HPP_
