/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief VirtIO 驱动（MMIO 与 PCI 传输）
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_VIRTIO_DRIVER_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_VIRTIO_DRIVER_HPP_

#include <cstddef>
#include <cstdint>
#include <concepts>
#include <memory>
#include <optional>

#include "bus_descriptor.hpp"
#include "dma_adapter.hpp"
#include "driver/controller_factory.hpp"
#include "driver_ops.hpp"
#include "driver_probe.hpp"
#include "kernel_log.hpp"

namespace virtio {

/// "virt"（小端）
inline constexpr uint32_t kMmioMagicValue = 0x74726976;

/// virtio-mmio 寄存器偏移
/// @see virtio-v1.2#4.2.2 MMIO Device Register Layout
struct MmioReg {
  static constexpr size_t kMagicValue = 0x000;
  static constexpr size_t kVersion = 0x004;
  static constexpr size_t kDeviceId = 0x008;
  static constexpr size_t kVendorId = 0x00C;
};

/// 探测需要读取的寄存器范围
inline constexpr size_t kMmioHeaderSize = MmioReg::kVendorId + sizeof(uint32_t);

/// legacy 与 modern 两种 virtio-mmio 版本
inline constexpr uint32_t kMmioVersionLegacy = 1;
inline constexpr uint32_t kMmioVersionModern = 2;

/// VirtIO 设备类型（来自 VirtIO 1.2 规范）
enum class DeviceId : uint32_t {
  kInvalid = 0,
  kNet = 1,
  kBlock = 2,
  kConsole = 3,
  kEntropy = 4,
  kGpu = 16,
  kInput = 18,
};

inline constexpr uint16_t kPciVendorId = 0x1AF4;
/// modern 设备 ID = 0x1040 + VirtIO 设备类型
inline constexpr uint16_t kPciModernDeviceIdBase = 0x1040;

/**
 * @brief transitional 设备 ID
 * @return uint16_t 该类型没有 transitional ID 时返回 0
 */
constexpr auto TransitionalPciDeviceId(DeviceId id) -> uint16_t {
  switch (id) {
    case DeviceId::kNet:
      return 0x1000;
    case DeviceId::kBlock:
      return 0x1001;
    case DeviceId::kConsole:
      return 0x1003;
    case DeviceId::kEntropy:
      return 0x1005;
    default:
      return 0;
  }
}

constexpr auto ModernPciDeviceId(DeviceId id) -> uint16_t {
  return static_cast<uint16_t>(kPciModernDeviceIdBase +
                               static_cast<uint32_t>(id));
}

/// 设备类别与 VirtIO 设备类型的对应
template <typename Ops>
struct DeviceTraits;

template <>
struct DeviceTraits<NetDriverOps> {
  static constexpr DeviceId kDeviceId = DeviceId::kNet;
  static constexpr DeviceClass kClass = DeviceClass::kNet;
  static constexpr const char* kName = "virtio-net";
};

template <>
struct DeviceTraits<BlockDriverOps> {
  static constexpr DeviceId kDeviceId = DeviceId::kBlock;
  static constexpr DeviceClass kClass = DeviceClass::kBlock;
  static constexpr const char* kName = "virtio-blk";
};

template <>
struct DeviceTraits<DisplayDriverOps> {
  static constexpr DeviceId kDeviceId = DeviceId::kGpu;
  static constexpr DeviceClass kClass = DeviceClass::kDisplay;
  static constexpr const char* kName = "virtio-gpu";
};

template <typename Ops>
concept DeviceOps = requires {
  { DeviceTraits<Ops>::kDeviceId } -> std::convertible_to<DeviceId>;
  { DeviceTraits<Ops>::kClass } -> std::convertible_to<DeviceClass>;
};

}  // namespace virtio

/**
 * @brief VirtIO 驱动
 *
 * 每个设备类别一个实例。MMIO 探测检查 magic、版本和 device_id，
 * device_id 为 0 的槽位是空槽；PCI 探测按 vendor 0x1AF4 与
 * modern/transitional 设备 ID 匹配。传输层初始化交给工厂。
 *
 * @tparam Ops NetDriverOps / BlockDriverOps / DisplayDriverOps
 */
template <virtio::DeviceOps Ops>
class VirtioDriver final : public DriverProbe {
 public:
  using Traits = virtio::DeviceTraits<Ops>;

  VirtioDriver(DmaAdapter& dma, VirtioTransportFactory<Ops>* factory)
      : dma_(dma), factory_(factory) {}

  [[nodiscard]] auto GetName() const -> const char* override {
    return Traits::kName;
  }

  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return Traits::kClass;
  }

  [[nodiscard]] auto GetFamily() const -> DriverFamily override {
    return DriverFamily::kVirtio;
  }

  auto ProbeMmio(const MmioRegion& region) -> ProbeResult override {
    auto regs = dma_.MapRegisterWindow(region);
    if (!regs.IsValid() || !regs.Contains(0, virtio::kMmioHeaderSize)) {
      return std::nullopt;
    }

    if (regs.Read<uint32_t>(virtio::MmioReg::kMagicValue) !=
        virtio::kMmioMagicValue) {
      klog::Debug("%s: 0x%lX not a VirtIO device\n", Traits::kName,
                  region.base);
      return std::nullopt;
    }

    const auto version = regs.Read<uint32_t>(virtio::MmioReg::kVersion);
    if (version != virtio::kMmioVersionLegacy &&
        version != virtio::kMmioVersionModern) {
      klog::Warn("%s: 0x%lX unsupported version %u\n", Traits::kName,
                 region.base, version);
      return std::nullopt;
    }

    const auto device_id = static_cast<virtio::DeviceId>(
        regs.Read<uint32_t>(virtio::MmioReg::kDeviceId));
    if (device_id != Traits::kDeviceId) {
      return std::nullopt;
    }

    klog::Info("%s: found at 0x%lX (version %u)\n", Traits::kName, region.base,
               version);
    if (factory_ == nullptr) {
      klog::Warn("%s: no transport implementation\n", Traits::kName);
      return std::nullopt;
    }

    return Finish(factory_->CreateMmio(std::move(regs), dma_));
  }

  auto ProbePci(PciRoot& root, const PciDeviceDescriptor& device)
      -> ProbeResult override {
    if (!Matches(device.info)) {
      return std::nullopt;
    }

    const auto& id = device.function;
    klog::Info("%s: found %04x:%04x at %02x:%02x.%u\n", Traits::kName,
               device.info.vendor_id, device.info.device_id, id.bus, id.device,
               id.function);
    if (factory_ == nullptr) {
      klog::Warn("%s: no transport implementation\n", Traits::kName);
      return std::nullopt;
    }

    return Finish(factory_->CreatePci(root, device, dma_));
  }

  [[nodiscard]] static constexpr auto Matches(const PciFunctionInfo& info)
      -> bool {
    if (info.vendor_id != virtio::kPciVendorId) {
      return false;
    }
    constexpr auto kTransitional =
        virtio::TransitionalPciDeviceId(Traits::kDeviceId);
    return info.device_id == virtio::ModernPciDeviceId(Traits::kDeviceId) ||
           (kTransitional != 0 && info.device_id == kTransitional);
  }

 private:
  auto Finish(Expected<std::unique_ptr<Ops>> device) -> ProbeResult {
    if (!device.has_value()) {
      klog::Err("%s: initialization failed: %s\n", Traits::kName,
                device.error().message());
      return ProbeResult::Failed(device.error());
    }
    if (*device == nullptr) {
      return ProbeResult::Failed(Error(ErrorCode::kDeviceInitFailed));
    }
    return DeviceHandle::From(std::move(*device));
  }

  DmaAdapter& dma_;
  VirtioTransportFactory<Ops>* factory_;
};

using VirtioNetDriver = VirtioDriver<NetDriverOps>;
using VirtioBlkDriver = VirtioDriver<BlockDriverOps>;
using VirtioGpuDriver = VirtioDriver<DisplayDriverOps>;

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_VIRTIO_DRIVER_HPP_
