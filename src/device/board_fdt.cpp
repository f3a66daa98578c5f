/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "board_fdt.hpp"

#include <cstring>

#include "kernel_log.hpp"

namespace {

/// 设备树 compatible 与驱动族的对应
struct FdtFamilyEntry {
  const char* compatible;
  DriverFamily family;
};

constexpr FdtFamilyEntry kFdtFamilies[] = {
    {"virtio,mmio", DriverFamily::kVirtio},
};

/// 读取 cells 个大端 32 位 cell 组成的值
auto ReadCells(const fdt32_t* cells, int count) -> uint64_t {
  uint64_t value = 0;
  for (int i = 0; i < count; ++i) {
    value = (value << 32) | fdt32_to_cpu(cells[i]);
  }
  return value;
}

}  // namespace

auto BoardFdt::ValidateHeader() const -> Expected<void> {
  if (blob_ == nullptr) {
    return std::unexpected(Error(ErrorCode::kFdtInvalidAddress));
  }
  if (fdt_check_header(blob_) != 0) {
    return std::unexpected(Error(ErrorCode::kFdtInvalidHeader));
  }
  return {};
}

auto BoardFdt::IsEnabled(int offset) const -> bool {
  int len = 0;
  const auto* status_prop = fdt_get_property(blob_, offset, "status", &len);
  if (status_prop == nullptr) {
    return true;
  }

  const char* status = reinterpret_cast<const char*>(status_prop->data);
  return strcmp(status, "okay") == 0 || strcmp(status, "ok") == 0;
}

auto BoardFdt::GetRegProperty(int offset) const -> Expected<MmioRegion> {
  const int parent = fdt_parent_offset(blob_, offset);
  if (parent < 0) {
    return std::unexpected(Error(ErrorCode::kFdtNodeNotFound));
  }
  const int address_cells = fdt_address_cells(blob_, parent);
  const int size_cells = fdt_size_cells(blob_, parent);
  if (address_cells < 1 || address_cells > 2 || size_cells < 1 ||
      size_cells > 2) {
    return std::unexpected(Error(ErrorCode::kFdtParseFailed));
  }

  int len = 0;
  const auto* prop = fdt_get_property(blob_, offset, "reg", &len);
  if (prop == nullptr) {
    return std::unexpected(Error(ErrorCode::kFdtPropertyNotFound));
  }

  const auto entry_size =
      static_cast<size_t>(address_cells + size_cells) * sizeof(fdt32_t);
  if (len < 0 || static_cast<size_t>(len) < entry_size) {
    return std::unexpected(Error(ErrorCode::kFdtInvalidPropertySize));
  }

  const auto* reg = reinterpret_cast<const fdt32_t*>(prop->data);
  return MmioRegion{
      .base = ReadCells(reg, address_cells),
      .size = static_cast<size_t>(ReadCells(reg + address_cells, size_cells)),
  };
}

auto BoardConfigFromFdt(const void* blob) -> Expected<BoardConfig> {
  BoardFdt fdt(blob);
  if (auto valid = fdt.ValidateHeader(); !valid.has_value()) {
    klog::Err("BoardConfigFromFdt: %s\n", valid.error().message());
    return std::unexpected(valid.error());
  }

  BoardConfig board;
  for (const auto& entry : kFdtFamilies) {
    fdt.ForEachEnabledCompatible(entry.compatible, [&](int offset) -> bool {
      auto reg = fdt.GetRegProperty(offset);
      if (!reg.has_value()) {
        klog::Warn("BoardConfigFromFdt: '%s' reg: %s\n",
                   fdt_get_name(blob, offset, nullptr), reg.error().message());
        return true;
      }

      auto added = board.AddRegion(
          BoardMmioRegion{.region = reg.value(), .family = entry.family});
      if (!added.has_value()) {
        klog::Warn("BoardConfigFromFdt: region 0x%lX dropped: %s\n",
                   reg.value().base, added.error().message());
        return added.error().code != ErrorCode::kOutOfMemory;
      }
      return true;
    });
  }

  klog::Debug("BoardConfigFromFdt: %zu MMIO region(s)\n",
              board.GetRegions().size());
  return board;
}
