/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_PCI_ROOT_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_PCI_ROOT_HPP_

#include <cstddef>
#include <cstdint>

#include "bus_descriptor.hpp"
#include "expected.hpp"

/**
 * @brief PCI 根总线：配置空间遍历器的窄接口
 *
 * 具体的 ECAM/端口 I/O 遍历与 BAR 分配由平台实现，
 * 设备发现只通过此接口读取枚举结果。
 */
class PciRoot {
 public:
  virtual ~PciRoot() = default;

  /// 返回总线名称（用于日志）
  [[nodiscard]] virtual auto GetName() const -> const char* { return "pci"; }

  /**
   * @brief 枚举总线上所有 function
   * @param  out            输出数组
   * @param  max            out 的容量
   * @return Expected<size_t> 写入 out 的 function 数
   */
  virtual auto Enumerate(PciFunction* out, size_t max) -> Expected<size_t> = 0;

  /**
   * @brief 解析指定 function 的 BAR
   * @param  function       bus/device/function
   * @param  bar_index      BAR 序号 (0-5)
   * @return Expected<BarInfo> BAR 信息；未实现的 BAR 返回 kPciBarNotPresent
   */
  virtual auto GetBarInfo(const PciFunctionId& function, uint8_t bar_index)
      -> Expected<BarInfo> = 0;

  /// PCI function 最多 6 个 BAR
  static constexpr uint8_t kMaxBars = 6;
};

#endif /* HWPROBE_SRC_DEVICE_INCLUDE_PCI_ROOT_HPP_ */
