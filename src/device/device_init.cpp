/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "device_init.hpp"

#include "driver/bcm2835_sdhci_driver.hpp"
#include "driver/intel_nic_driver.hpp"
#include "driver/ramdisk_driver.hpp"
#include "driver/virtio_driver.hpp"
#include "kernel_log.hpp"

auto DriverSet::HasController(DriverKind kind) const -> bool {
  switch (kind) {
    case DriverKind::kVirtioNet:
      return factories_.virtio_net != nullptr;
    case DriverKind::kIxgbe:
      return factories_.ixgbe != nullptr;
    case DriverKind::kIgb:
      return factories_.igb != nullptr;
    case DriverKind::kVirtioBlk:
      return factories_.virtio_blk != nullptr;
    case DriverKind::kBcm2835Sdhci:
      return factories_.bcm2835_sdhci != nullptr;
    case DriverKind::kVirtioGpu:
      return factories_.virtio_gpu != nullptr;
    default:
      return true;
  }
}

auto DriverSet::Create(DriverKind kind, const DriverConfig& config)
    -> std::unique_ptr<DriverProbe> {
  switch (kind) {
    case DriverKind::kVirtioNet:
      return std::make_unique<VirtioNetDriver>(dma_, factories_.virtio_net);
    case DriverKind::kIxgbe:
      return std::make_unique<IxgbeDriver>(dma_, factories_.ixgbe);
    case DriverKind::kIgb:
      return std::make_unique<IgbDriver>(dma_, factories_.igb);
    case DriverKind::kVirtioBlk:
      return std::make_unique<VirtioBlkDriver>(dma_, factories_.virtio_blk);
    case DriverKind::kRamDisk:
      return std::make_unique<RamDiskDriver>(config.ramdisk_size);
    case DriverKind::kBcm2835Sdhci:
      return std::make_unique<Bcm2835SdhciDriver>(
          config.sdhci_region, dma_, factories_.bcm2835_sdhci);
    case DriverKind::kVirtioGpu:
      return std::make_unique<VirtioGpuDriver>(dma_, factories_.virtio_gpu);
    default:
      return nullptr;
  }
}

auto DriverSet::Build(const DriverConfig& config, DriverRegistry& registry)
    -> Expected<void> {
  for (auto device_class :
       {DeviceClass::kNet, DeviceClass::kBlock, DeviceClass::kDisplay}) {
    for (auto kind : config.GetKinds(device_class)) {
      if (GetDriverKindClass(kind) != device_class) {
        klog::Err("DriverSet: '%s' configured as a %s driver\n",
                  GetDriverKindName(kind), GetDeviceClassName(device_class));
        return std::unexpected(Error(ErrorCode::kDriverClassMismatch));
      }
      if (probes_.full()) {
        return std::unexpected(Error(ErrorCode::kRegistryFull));
      }

      if (!HasController(kind)) {
        klog::Warn("DriverSet: '%s' has no controller implementation\n",
                   GetDriverKindName(kind));
      }

      auto probe = Create(kind, config);
      if (probe == nullptr) {
        return std::unexpected(Error(ErrorCode::kInvalidArgument));
      }

      auto registered = registry.Register(device_class, *probe);
      if (!registered.has_value()) {
        klog::Err("DriverSet: failed to register '%s': %s\n",
                  GetDriverKindName(kind), registered.error().message());
        return std::unexpected(registered.error());
      }
      probes_.push_back(std::move(probe));
    }
  }

  registry.Seal();
  return {};
}

auto DeviceInit(const DriverConfig& config, const BoardConfig& board,
                const ControllerFactories& factories, DmaAdapter& dma,
                PciRoot* pci_root) -> Expected<BoundDevices> {
  DriverRegistry registry;
  DriverSet drivers(dma, factories);
  if (auto built = drivers.Build(config, registry); !built.has_value()) {
    klog::Err("DeviceInit: driver configuration rejected: %s\n",
              built.error().message());
    return std::unexpected(built.error());
  }

  DeviceManager manager(registry);
  if (auto probed = manager.ProbeAll(board, pci_root); !probed.has_value()) {
    klog::Err("DeviceInit: ProbeAll failed: %s\n", probed.error().message());
    return std::unexpected(probed.error());
  }

  klog::Info("DeviceInit: complete\n");
  return manager.TakeDevices();
}
