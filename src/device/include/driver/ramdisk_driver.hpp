/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief RAM disk 驱动
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_RAMDISK_DRIVER_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_RAMDISK_DRIVER_HPP_

#include <cstddef>
#include <memory>

#include "driver/ramdisk.hpp"
#include "driver_probe.hpp"
#include "hwprobe_config.hpp"
#include "kernel_log.hpp"

/**
 * @brief RAM disk 驱动：不在任何总线上，全局探测时无条件产出一个块设备
 */
class RamDiskDriver final : public DriverProbe {
 public:
  explicit RamDiskDriver(size_t size = hwprobe::config::kDefaultRamDiskSize)
      : size_(size) {}

  [[nodiscard]] auto GetName() const -> const char* override {
    return "ramdisk";
  }

  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return DeviceClass::kBlock;
  }

  auto ProbeGlobal() -> ProbeResult override {
    auto disk = std::make_unique<RamDisk>(size_);
    if (!disk->IsValid()) {
      klog::Err("RamDiskDriver: failed to allocate %zu bytes\n", size_);
      return ProbeResult::Failed(Error(ErrorCode::kOutOfMemory));
    }
    klog::Info("RamDiskDriver: %zu blocks of %zu bytes\n",
               static_cast<size_t>(disk->GetBlockCount()), RamDisk::kBlockSize);
    return DeviceHandle::FromBlock(std::move(disk));
  }

  [[nodiscard]] auto GetSize() const -> size_t { return size_; }

 private:
  size_t size_;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_RAMDISK_DRIVER_HPP_
