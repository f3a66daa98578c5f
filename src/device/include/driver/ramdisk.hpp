/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 内存块设备
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_RAMDISK_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_RAMDISK_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "driver_ops.hpp"
#include "expected.hpp"

/**
 * @brief 以一段零初始化内存为介质的块设备
 */
class RamDisk final : public BlockDriverOps {
 public:
  static constexpr size_t kBlockSize = 512;

  /**
   * @brief 构造函数
   * @param  size           字节数，向上取整到整块
   * @post size 为 0 或分配失败时 IsValid() 为 false
   */
  explicit RamDisk(size_t size);

  [[nodiscard]] auto IsValid() const -> bool { return storage_ != nullptr; }

  /// 介质大小（字节）
  [[nodiscard]] auto GetSize() const -> size_t { return size_; }

  /// 介质内容的只读视图
  [[nodiscard]] auto GetData() const -> std::span<const uint8_t> {
    return {storage_.get(), size_};
  }

  [[nodiscard]] auto GetName() const -> const char* override {
    return "ramdisk";
  }

  [[nodiscard]] auto GetBlockSize() const -> size_t override {
    return kBlockSize;
  }

  [[nodiscard]] auto GetBlockCount() const -> uint64_t override {
    return GetSize() / kBlockSize;
  }

  auto ReadBlock(uint64_t block_id, std::span<uint8_t> buffer)
      -> Expected<void> override;

  auto WriteBlock(uint64_t block_id, std::span<const uint8_t> buffer)
      -> Expected<void> override;

 private:
  /// 检查 [block_id, block_id + len / kBlockSize) 是否在介质内，返回字节偏移
  [[nodiscard]] auto CheckRange(uint64_t block_id, size_t len) const
      -> Expected<size_t>;

  std::unique_ptr<uint8_t[]> storage_;
  size_t size_{0};
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_RAMDISK_HPP_
