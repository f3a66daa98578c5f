/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 独占的 MMIO 寄存器窗口
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_MMIO_WINDOW_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_MMIO_WINDOW_HPP_

#include <etl/io_port.h>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "expected.hpp"

class DmaAdapter;

/**
 * @brief 已映射的设备寄存器窗口
 *
 * 只能由 DmaAdapter::MapRegisterWindow() 创建，只能移动不能复制，
 * 同一时刻只有一个驱动实例持有某个窗口的写能力。
 */
class MmioWindow {
 public:
  /// 窗口是否有效（默认构造或被移走后无效）
  [[nodiscard]] auto IsValid() const -> bool { return vbase_ != 0; }

  /// 内核虚拟基地址
  [[nodiscard]] auto Base() const -> uintptr_t { return vbase_; }

  /// 物理基地址
  [[nodiscard]] auto PhysBase() const -> uintptr_t { return pbase_; }

  [[nodiscard]] auto Size() const -> size_t { return size_; }

  /// [offset, offset + width) 是否落在窗口内
  [[nodiscard]] auto Contains(size_t offset, size_t width) const -> bool {
    return width <= size_ && offset <= size_ - width;
  }

  /**
   * @brief 读寄存器
   * @pre Contains(offset, sizeof(T))
   */
  template <typename T>
  [[nodiscard]] auto Read(size_t offset) const -> T {
    assert(Contains(offset, sizeof(T)) && "MmioWindow: read out of window");
    etl::io_port_ro<T> reg{reinterpret_cast<void*>(vbase_ + offset)};
    return reg.read();
  }

  /**
   * @brief 写寄存器
   * @pre Contains(offset, sizeof(T))
   */
  template <typename T>
  auto Write(size_t offset, T value) -> void {
    assert(Contains(offset, sizeof(T)) && "MmioWindow: write out of window");
    etl::io_port_wo<T> reg{reinterpret_cast<void*>(vbase_ + offset)};
    reg.write(value);
  }

  /// 带边界与对齐检查的读
  template <typename T>
  [[nodiscard]] auto TryRead(size_t offset) const -> Expected<T> {
    if (auto check = CheckAccess(offset, sizeof(T)); !check) {
      return std::unexpected(check.error());
    }
    return Read<T>(offset);
  }

  /// 带边界与对齐检查的写
  template <typename T>
  auto TryWrite(size_t offset, T value) -> Expected<void> {
    if (auto check = CheckAccess(offset, sizeof(T)); !check) {
      return check;
    }
    Write<T>(offset, value);
    return {};
  }

  /// @name 构造/析构函数
  /// @{
  MmioWindow() = default;
  ~MmioWindow() = default;
  MmioWindow(const MmioWindow&) = delete;
  auto operator=(const MmioWindow&) -> MmioWindow& = delete;
  MmioWindow(MmioWindow&& other) noexcept
      : vbase_(std::exchange(other.vbase_, 0)),
        pbase_(std::exchange(other.pbase_, 0)),
        size_(std::exchange(other.size_, 0)) {}
  auto operator=(MmioWindow&& other) noexcept -> MmioWindow& {
    if (this != &other) {
      vbase_ = std::exchange(other.vbase_, 0);
      pbase_ = std::exchange(other.pbase_, 0);
      size_ = std::exchange(other.size_, 0);
    }
    return *this;
  }
  /// @}

 private:
  friend class DmaAdapter;

  MmioWindow(uintptr_t vbase, uintptr_t pbase, size_t size)
      : vbase_(vbase), pbase_(pbase), size_(size) {}

  [[nodiscard]] auto CheckAccess(size_t offset, size_t width) const
      -> Expected<void> {
    if (!IsValid() || !Contains(offset, width)) {
      return std::unexpected(Error(ErrorCode::kMmioOutOfWindow));
    }
    if (((vbase_ + offset) & (width - 1)) != 0) {
      return std::unexpected(Error(ErrorCode::kMmioUnaligned));
    }
    return {};
  }

  uintptr_t vbase_{0};
  uintptr_t pbase_{0};
  size_t size_{0};
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_MMIO_WINDOW_HPP_
