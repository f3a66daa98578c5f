/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "dma_adapter.hpp"

#include "kernel_log.hpp"

DmaAdapter::DmaAdapter(MemoryService& memory, const MonotonicClock& clock,
                       DmaConfig config)
    : memory_(memory), clock_(clock), config_(config) {
  if (config_.alignment == 0 ||
      (config_.alignment & (config_.alignment - 1)) != 0) {
    klog::Warn("DmaAdapter: alignment %zu is not a power of two, using %zu\n",
               config_.alignment, hwprobe::config::kDefaultDmaAlignment);
    config_.alignment = hwprobe::config::kDefaultDmaAlignment;
  }
}

auto DmaAdapter::AllocCoherent(size_t size) -> DmaBuffer {
  if (size == 0) {
    return {};
  }

  void* vaddr = memory_.AllocCoherent(size, config_.alignment);
  if (vaddr == nullptr) {
    klog::Warn("DmaAdapter: coherent allocation of %zu bytes failed\n", size);
    return {};
  }

  auto paddr = memory_.VirtToPhys(reinterpret_cast<uintptr_t>(vaddr));
  return DmaBuffer{
      .bus_addr = PhysToBus(paddr),
      .cpu_addr = vaddr,
      .size = size,
  };
}

auto DmaAdapter::DeallocCoherent(const DmaBuffer& buffer) -> void {
  if (!buffer.IsValid()) {
    return;
  }
  memory_.FreeCoherent(buffer.cpu_addr, buffer.size, config_.alignment);
}

auto DmaAdapter::MmioPhysToVirt(uintptr_t paddr) const -> uintptr_t {
  return memory_.PhysToVirt(paddr);
}

auto DmaAdapter::MmioVirtToPhys(uintptr_t vaddr) const -> uintptr_t {
  return memory_.VirtToPhys(vaddr);
}

auto DmaAdapter::MapRegisterWindow(const MmioRegion& region) const
    -> MmioWindow {
  if (region.base == 0 || region.size == 0) {
    return {};
  }
  auto paddr = static_cast<uintptr_t>(region.base);
  return MmioWindow(MmioPhysToVirt(paddr), paddr, region.size);
}

auto DmaAdapter::WaitUntil(std::chrono::nanoseconds duration) const
    -> Expected<void> {
  const auto deadline = clock_.Now() + duration;
  while (clock_.Now() < deadline) {
    ;
  }
  return {};
}
