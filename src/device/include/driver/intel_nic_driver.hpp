/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief Intel 以太网控制器驱动（ixgbe / igb）
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_INTEL_NIC_DRIVER_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_INTEL_NIC_DRIVER_HPP_

#include <cstdint>
#include <span>

#include "bus_descriptor.hpp"
#include "dma_adapter.hpp"
#include "driver/controller_factory.hpp"
#include "driver_ops.hpp"
#include "driver_probe.hpp"

namespace intel {
inline constexpr uint16_t kVendorId = 0x8086;
/// 82599 10GbE
inline constexpr uint16_t k82599DeviceId = 0x10FB;
/// 82576 GbE
inline constexpr uint16_t k82576DeviceId = 0x10C9;
}  // namespace intel

/**
 * @brief PCI 网卡驱动
 *
 * 按 vendor/device 精确匹配，要求 BAR0 为内存映射 BAR：
 * 映射 BAR0 后交给控制器工厂完成初始化。
 */
class PciNicDriver : public DriverProbe {
 public:
  /**
   * @brief 构造函数
   * @param  name           驱动名称
   * @param  match_table    匹配表，生存期须覆盖驱动
   * @param  dma            DMA 适配器
   * @param  factory        控制器初始化实现，nullptr 表示不支持
   */
  PciNicDriver(const char* name, std::span<const PciMatchKey> match_table,
               DmaAdapter& dma, ControllerFactory<NetDriverOps>* factory)
      : name_(name),
        match_table_(match_table),
        dma_(dma),
        factory_(factory) {}

  [[nodiscard]] auto GetName() const -> const char* override { return name_; }

  [[nodiscard]] auto GetClass() const -> DeviceClass override {
    return DeviceClass::kNet;
  }

  auto ProbePci(PciRoot& root, const PciDeviceDescriptor& device)
      -> ProbeResult override;

  [[nodiscard]] auto Matches(const PciFunctionInfo& info) const -> bool;

 private:
  const char* name_;
  std::span<const PciMatchKey> match_table_;
  DmaAdapter& dma_;
  ControllerFactory<NetDriverOps>* factory_;
};

/// Intel 82599 10GbE
class IxgbeDriver final : public PciNicDriver {
 public:
  IxgbeDriver(DmaAdapter& dma, ControllerFactory<NetDriverOps>* factory)
      : PciNicDriver("ixgbe", kMatchTable, dma, factory) {}

 private:
  static constexpr PciMatchKey kMatchTable[] = {
      {intel::kVendorId, intel::k82599DeviceId},
  };
};

/// Intel 82576 GbE
class IgbDriver final : public PciNicDriver {
 public:
  IgbDriver(DmaAdapter& dma, ControllerFactory<NetDriverOps>* factory)
      : PciNicDriver("igb", kMatchTable, dma, factory) {}

 private:
  static constexpr PciMatchKey kMatchTable[] = {
      {intel::kVendorId, intel::k82576DeviceId},
  };
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_INTEL_NIC_DRIVER_HPP_
