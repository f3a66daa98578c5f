/** @copyright Copyright The SimpleKernel Contributors */

#ifndef HWPROBE_SRC_INCLUDE_HWPROBE_CONFIG_HPP_
#define HWPROBE_SRC_INCLUDE_HWPROBE_CONFIG_HPP_

#include <cstddef>

namespace hwprobe::config {

// ── 驱动注册表容量 ──────────────────────────────────────────────
/// 每个设备类别最多注册的驱动数
inline constexpr size_t kMaxDriversPerClass = 8;

// ── 发现结果容量 ────────────────────────────────────────────────
/// 每个设备类别最多绑定的设备数
inline constexpr size_t kMaxDevicesPerClass = 16;

/// 单次 PCI 扫描最多处理的 function 数
inline constexpr size_t kMaxPciFunctions = 256;

/// 板级配置中最多的固定 MMIO 区域数
inline constexpr size_t kMaxBoardRegions = 32;

// ── DMA ──────────────────────────────────────────────────────────
/// 一致性 DMA 分配的默认对齐
inline constexpr size_t kDefaultDmaAlignment = 8;

// ── RAM disk ─────────────────────────────────────────────────────
/// 默认 RAM disk 大小 (16 MiB)
inline constexpr size_t kDefaultRamDiskSize = 0x100'0000;

}  // namespace hwprobe::config

#endif  // HWPROBE_SRC_INCLUDE_HWPROBE_CONFIG_HPP_
