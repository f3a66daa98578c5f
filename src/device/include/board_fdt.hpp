/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 从设备树构建板级配置
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_BOARD_FDT_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_BOARD_FDT_HPP_

// 禁用 GCC/Clang 的警告
#include <libfdt_env.h>
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#endif

#include <libfdt.h>

#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include <cstddef>
#include <cstdint>

#include "board_config.hpp"
#include "bus_descriptor.hpp"
#include "driver_probe.hpp"
#include "expected.hpp"

/**
 * @brief 设备树只读视图
 *
 * 只提供板级 MMIO 区域发现需要的查询。
 */
class BoardFdt {
 public:
  /**
   * @brief 构造函数
   * @param  blob           flattened device tree，生存期须覆盖本对象
   */
  explicit BoardFdt(const void* blob) : blob_(blob) {}

  /// 检查 FDT 头
  [[nodiscard]] auto ValidateHeader() const -> Expected<void>;

  /**
   * @brief 遍历所有启用的 compatible 节点
   * @param  compatible     compatible 字符串
   * @param  fn             bool(int offset)，返回 false 停止遍历
   */
  template <typename Fn>
  auto ForEachEnabledCompatible(const char* compatible, Fn&& fn) const
      -> void {
    int offset = -1;
    while (true) {
      offset = fdt_node_offset_by_compatible(blob_, offset, compatible);
      if (offset < 0) {
        return;
      }
      if (IsEnabled(offset) && !fn(offset)) {
        return;
      }
    }
  }

  /// 节点 status 缺省或为 "okay"/"ok" 时视为启用
  [[nodiscard]] auto IsEnabled(int offset) const -> bool;

  /**
   * @brief 读取节点 reg 属性的第一项
   *
   * 地址与长度的 cell 数取自父节点的 #address-cells / #size-cells。
   */
  [[nodiscard]] auto GetRegProperty(int offset) const -> Expected<MmioRegion>;

 private:
  const void* blob_;
};

/**
 * @brief 从设备树构建板级配置
 *
 * 每个启用的 virtio,mmio 节点的 reg 成为一个 virtio 区域。
 * reg 无法解析的节点被跳过并记录警告。
 *
 * @param  blob           flattened device tree
 * @return Expected<BoardConfig> FDT 头无效时返回 kFdtInvalidHeader
 */
[[nodiscard]] auto BoardConfigFromFdt(const void* blob) -> Expected<BoardConfig>;

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_BOARD_FDT_HPP_
