/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 内核内存服务与时钟的窄接口
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_MEMORY_SERVICE_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_MEMORY_SERVICE_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>

/**
 * @brief 内核物理/虚拟内存服务
 *
 * 物理地址与内核虚拟地址的转换，以及物理连续、cache 一致的内存分配。
 * 分配器自行串行化并发请求。
 */
class MemoryService {
 public:
  virtual ~MemoryService() = default;

  /// 物理地址 → 内核虚拟地址
  [[nodiscard]] virtual auto PhysToVirt(uintptr_t paddr) const -> uintptr_t = 0;

  /// 内核虚拟地址 → 物理地址
  [[nodiscard]] virtual auto VirtToPhys(uintptr_t vaddr) const -> uintptr_t = 0;

  /**
   * @brief 分配物理连续、cache 一致的内存
   * @param  size           字节数
   * @param  alignment      对齐（2 的幂）
   * @return void*          内核虚拟地址，失败返回 nullptr
   */
  virtual auto AllocCoherent(size_t size, size_t alignment) -> void* = 0;

  /**
   * @brief 释放 AllocCoherent 分配的内存
   * @pre size 与 alignment 与分配时一致
   */
  virtual auto FreeCoherent(void* vaddr, size_t size, size_t alignment)
      -> void = 0;
};

/**
 * @brief 单调时钟
 */
class MonotonicClock {
 public:
  virtual ~MonotonicClock() = default;

  /// 自启动以来经过的时间
  [[nodiscard]] virtual auto Now() const -> std::chrono::nanoseconds = 0;
};

#endif /* HWPROBE_SRC_DEVICE_INCLUDE_MEMORY_SERVICE_HPP_ */
