/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "driver/ramdisk.hpp"

#include <cstring>
#include <new>

namespace {

constexpr auto AlignUp(size_t size, size_t align) -> size_t {
  return (size + align - 1) / align * align;
}

}  // namespace

RamDisk::RamDisk(size_t size) {
  const size_t aligned = AlignUp(size, kBlockSize);
  if (aligned == 0) {
    return;
  }
  // 值初始化，介质初始全零
  storage_.reset(new (std::nothrow) uint8_t[aligned]());
  if (storage_ != nullptr) {
    size_ = aligned;
  }
}

auto RamDisk::ReadBlock(uint64_t block_id, std::span<uint8_t> buffer)
    -> Expected<void> {
  auto offset = CheckRange(block_id, buffer.size());
  if (!offset.has_value()) {
    return std::unexpected(offset.error());
  }
  std::memcpy(buffer.data(), storage_.get() + offset.value(),
              buffer.size());
  return {};
}

auto RamDisk::WriteBlock(uint64_t block_id, std::span<const uint8_t> buffer)
    -> Expected<void> {
  auto offset = CheckRange(block_id, buffer.size());
  if (!offset.has_value()) {
    return std::unexpected(offset.error());
  }
  std::memcpy(storage_.get() + offset.value(), buffer.data(),
              buffer.size());
  return {};
}

auto RamDisk::CheckRange(uint64_t block_id, size_t len) const
    -> Expected<size_t> {
  if (!IsValid()) {
    return std::unexpected(Error(ErrorCode::kDeviceNotReady));
  }
  if (len % kBlockSize != 0) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  const uint64_t blocks = len / kBlockSize;
  if (block_id > GetBlockCount() || blocks > GetBlockCount() - block_id) {
    return std::unexpected(Error(ErrorCode::kDeviceOutOfRange));
  }
  return static_cast<size_t>(block_id * kBlockSize);
}
