/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 设备类别接口：网络/块/显示驱动需要实现的操作
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_OPS_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_OPS_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "expected.hpp"

/// 设备类别
enum class DeviceClass : uint8_t {
  /// 网络设备
  kNet,
  /// 块设备
  kBlock,
  /// 显示设备
  kDisplay,
};

/// 设备类别数量
inline constexpr size_t kDeviceClassCount = 3;

[[nodiscard]] constexpr auto GetDeviceClassName(DeviceClass cls) -> const char* {
  switch (cls) {
    case DeviceClass::kNet:
      return "net";
    case DeviceClass::kBlock:
      return "block";
    case DeviceClass::kDisplay:
      return "display";
    default:
      return "unknown";
  }
}

[[nodiscard]] constexpr auto ToIndex(DeviceClass cls) -> size_t {
  return static_cast<size_t>(cls);
}

/**
 * @brief 所有驱动实例的公共接口
 */
class BaseDriverOps {
 public:
  virtual ~BaseDriverOps() = default;

  /**
   * @brief 获取设备名称（如 "ramdisk0"）
   * @return 设备名称
   */
  [[nodiscard]] virtual auto GetName() const -> const char* = 0;

  /**
   * @brief 获取设备类别
   * @return 设备类别
   */
  [[nodiscard]] virtual auto GetClass() const -> DeviceClass = 0;
};

/// MAC 地址
using MacAddress = std::array<uint8_t, 6>;

/**
 * @brief 网络设备接口
 */
class NetDriverOps : public BaseDriverOps {
 public:
  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return DeviceClass::kNet;
  }

  [[nodiscard]] virtual auto GetMacAddress() const -> MacAddress = 0;

  /**
   * @brief 发送一个以太网帧
   * @param  frame          帧数据
   * @return Expected<void> 成功或错误
   */
  virtual auto Transmit(std::span<const uint8_t> frame) -> Expected<void> = 0;

  /**
   * @brief 接收一个以太网帧
   * @param  buffer         输出缓冲区
   * @return Expected<size_t> 实际收到的字节数，无帧时为 0
   */
  virtual auto Receive(std::span<uint8_t> buffer) -> Expected<size_t> = 0;
};

/**
 * @brief 块设备接口
 * @details 以固定大小的块为最小 I/O 单位
 */
class BlockDriverOps : public BaseDriverOps {
 public:
  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return DeviceClass::kBlock;
  }

  /**
   * @brief 获取块大小（通常为 512 字节）
   * @return 块大小（字节）
   */
  [[nodiscard]] virtual auto GetBlockSize() const -> size_t = 0;

  /**
   * @brief 获取设备总块数
   * @return 总块数
   */
  [[nodiscard]] virtual auto GetBlockCount() const -> uint64_t = 0;

  /**
   * @brief 读取从 block_id 开始的连续块
   * @param  block_id       起始块号
   * @param  buffer         输出缓冲区，大小须为块大小的整数倍
   * @return Expected<void> 成功或错误
   * @pre buffer.size() % GetBlockSize() == 0
   */
  virtual auto ReadBlock(uint64_t block_id, std::span<uint8_t> buffer)
      -> Expected<void> = 0;

  /**
   * @brief 写入从 block_id 开始的连续块
   * @param  block_id       起始块号
   * @param  buffer         输入缓冲区，大小须为块大小的整数倍
   * @return Expected<void> 成功或错误
   */
  virtual auto WriteBlock(uint64_t block_id, std::span<const uint8_t> buffer)
      -> Expected<void> = 0;

  /**
   * @brief 刷新设备缓存到物理介质
   * @return Expected<void> 成功或错误
   */
  virtual auto Flush() -> Expected<void> { return {}; }
};

/// 帧缓冲信息
struct DisplayInfo {
  uint32_t width;
  uint32_t height;
  /// 帧缓冲的内核虚拟地址
  uintptr_t fb_base_vaddr;
  size_t fb_size;
};

/**
 * @brief 显示设备接口
 */
class DisplayDriverOps : public BaseDriverOps {
 public:
  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return DeviceClass::kDisplay;
  }

  [[nodiscard]] virtual auto GetInfo() const -> DisplayInfo = 0;

  /// 将帧缓冲内容提交到屏幕
  virtual auto Flush() -> Expected<void> = 0;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_OPS_HPP_
