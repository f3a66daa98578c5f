/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 控制器驱动的初始化入口
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_CONTROLLER_FACTORY_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_CONTROLLER_FACTORY_HPP_

#include <memory>

#include "bus_descriptor.hpp"
#include "dma_adapter.hpp"
#include "expected.hpp"
#include "mmio_window.hpp"
#include "pci_root.hpp"

/**
 * @brief 控制器工厂：寄存器级初始化由具体控制器驱动实现
 *
 * 探测代码负责识别设备并映射寄存器窗口，工厂接管窗口完成复位、
 * 队列建立等硬件初始化。初始化副作用不可撤销，失败时设备被放弃。
 *
 * @tparam Ops 产出的设备类别接口（NetDriverOps 等）
 */
template <typename Ops>
class ControllerFactory {
 public:
  virtual ~ControllerFactory() = default;

  /**
   * @brief 初始化控制器
   * @param  regs           独占的寄存器窗口
   * @param  dma            DMA 适配器，驱动实例可长期持有
   * @return Expected<std::unique_ptr<Ops>> 初始化完成的驱动实例
   */
  virtual auto Create(MmioWindow regs, DmaAdapter& dma)
      -> Expected<std::unique_ptr<Ops>> = 0;
};

/**
 * @brief VirtIO 传输层工厂
 *
 * MMIO 传输直接使用寄存器窗口；PCI 传输需要通过 capability
 * 定位通用配置结构，因此拿到整个 PCI 根总线。
 */
template <typename Ops>
class VirtioTransportFactory {
 public:
  virtual ~VirtioTransportFactory() = default;

  virtual auto CreateMmio(MmioWindow regs, DmaAdapter& dma)
      -> Expected<std::unique_ptr<Ops>> = 0;

  virtual auto CreatePci(PciRoot& root, const PciDeviceDescriptor& device,
                         DmaAdapter& dma) -> Expected<std::unique_ptr<Ops>> = 0;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_DRIVER_CONTROLLER_FACTORY_HPP_
