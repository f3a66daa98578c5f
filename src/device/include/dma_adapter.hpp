/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief DMA 地址转换适配器
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DMA_ADAPTER_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DMA_ADAPTER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "bus_descriptor.hpp"
#include "expected.hpp"
#include "hwprobe_config.hpp"
#include "memory_service.hpp"
#include "mmio_window.hpp"

/// DMA 适配器配置
struct DmaConfig {
  /// 一致性分配的对齐
  size_t alignment{hwprobe::config::kDefaultDmaAlignment};
  /// 总线地址 = 物理地址 + bus_offset
  uint64_t bus_offset{0};
};

/**
 * @brief 一次一致性分配的记录
 *
 * 释放时必须原样交回分配时得到的三元组。
 */
struct DmaBuffer {
  /// 设备可见的总线地址
  uint64_t bus_addr{0};
  /// CPU 访问用的内核虚拟地址
  void* cpu_addr{nullptr};
  size_t size{0};

  /// 分配失败时返回 {0, nullptr, 0}
  [[nodiscard]] auto IsValid() const -> bool { return cpu_addr != nullptr; }
};

/**
 * @brief DMA 地址转换适配器
 *
 * 为 DMA 驱动提供一致性内存分配/释放、MMIO 物理/虚拟地址转换、
 * 寄存器窗口映射以及忙等待。交给驱动的每个总线地址都来自这里。
 */
class DmaAdapter {
 public:
  /**
   * @brief 构造函数
   * @param  memory         内核内存服务
   * @param  clock          单调时钟，用于忙等待
   * @param  config         对齐与总线偏移
   */
  DmaAdapter(MemoryService& memory, const MonotonicClock& clock,
             DmaConfig config = {});

  /**
   * @brief 分配物理连续、cache 一致的 DMA 缓冲区
   * @param  size           字节数
   * @return DmaBuffer      失败时返回无效记录（IsValid() == false），
   *                        由调用方决定是否致命
   */
  [[nodiscard]] auto AllocCoherent(size_t size) -> DmaBuffer;

  /**
   * @brief 释放 AllocCoherent 分配的缓冲区
   * @param  buffer         分配时返回的记录，必须原样交回
   * @pre buffer 由本适配器分配且未被释放
   */
  auto DeallocCoherent(const DmaBuffer& buffer) -> void;

  /// MMIO 物理地址 → 内核虚拟地址
  [[nodiscard]] auto MmioPhysToVirt(uintptr_t paddr) const -> uintptr_t;

  /// 内核虚拟地址 → MMIO 物理地址
  [[nodiscard]] auto MmioVirtToPhys(uintptr_t vaddr) const -> uintptr_t;

  [[nodiscard]] auto PhysToBus(uintptr_t paddr) const -> uint64_t {
    return static_cast<uint64_t>(paddr) + config_.bus_offset;
  }

  [[nodiscard]] auto BusToPhys(uint64_t bus_addr) const -> uintptr_t {
    return static_cast<uintptr_t>(bus_addr - config_.bus_offset);
  }

  /**
   * @brief 映射设备寄存器窗口
   * @param  region         物理区域
   * @return MmioWindow     独占窗口；region 为空时返回无效窗口
   */
  [[nodiscard]] auto MapRegisterWindow(const MmioRegion& region) const
      -> MmioWindow;

  /**
   * @brief 忙等待 duration
   * @param  duration       等待时长
   * @return Expected<void> 总是成功
   */
  auto WaitUntil(std::chrono::nanoseconds duration) const -> Expected<void>;

  [[nodiscard]] auto GetConfig() const -> const DmaConfig& { return config_; }

  /// @name 构造/析构函数
  /// @{
  DmaAdapter() = delete;
  ~DmaAdapter() = default;
  DmaAdapter(const DmaAdapter&) = delete;
  DmaAdapter(DmaAdapter&&) = delete;
  auto operator=(const DmaAdapter&) -> DmaAdapter& = delete;
  auto operator=(DmaAdapter&&) -> DmaAdapter& = delete;
  /// @}

 private:
  MemoryService& memory_;
  const MonotonicClock& clock_;
  DmaConfig config_;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DMA_ADAPTER_HPP_
