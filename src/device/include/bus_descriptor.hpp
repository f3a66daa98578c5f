/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 总线位置描述：MMIO 区域与 PCI function
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_BUS_DESCRIPTOR_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_BUS_DESCRIPTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <variant>

/// 固定 MMIO 区域（板级常量，非运行期发现）
struct MmioRegion {
  /// 物理基地址
  uint64_t base;
  size_t size;
};

/// PCI bus/device/function 三元组
struct PciFunctionId {
  uint8_t bus;
  uint8_t device;
  uint8_t function;

  [[nodiscard]] constexpr auto operator==(const PciFunctionId&) const
      -> bool = default;
};

/// PCI header type（低 7 位）
enum class PciHeaderType : uint8_t {
  /// 普通设备
  kStandard = 0x00,
  /// PCI-to-PCI 桥
  kPciBridge = 0x01,
  /// CardBus 桥
  kCardBusBridge = 0x02,
};

/// PCI 配置空间中的设备标识
struct PciFunctionInfo {
  uint16_t vendor_id;
  uint16_t device_id;
  uint8_t class_code;
  uint8_t subclass;
  PciHeaderType header_type{PciHeaderType::kStandard};
};

/// 总线枚举器返回的一个 function
struct PciFunction {
  PciFunctionId id;
  PciFunctionInfo info;
};

/// @name BAR 信息
/// @{

/// 内存映射 BAR
struct MemoryBar {
  /// 物理地址
  uint64_t address;
  uint64_t size;
  bool prefetchable;
  bool is_64bit;
};

/// I/O 端口 BAR
struct IoBar {
  uint32_t port;
  uint32_t size;
};

/// BAR 解析结果，使用前必须检查类型
using BarInfo = std::variant<MemoryBar, IoBar>;

/// @}

/**
 * @brief 交给驱动探测的 PCI 设备描述
 *
 * bar0 为 BAR0 的解析结果，DMA 驱动需要内存映射的 BAR0。
 */
struct PciDeviceDescriptor {
  PciFunctionId function;
  PciFunctionInfo info;
  BarInfo bar0;
};

/// PCI 匹配键（vendor + device ID，精确匹配）
struct PciMatchKey {
  uint16_t vendor_id;
  uint16_t device_id;

  [[nodiscard]] constexpr auto Matches(const PciFunctionInfo& info) const
      -> bool {
    return info.vendor_id == vendor_id && info.device_id == device_id;
  }
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_BUS_DESCRIPTOR_HPP_
