/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "board_config.hpp"

#include "kernel_log.hpp"

BoardConfig::BoardConfig(std::initializer_list<BoardMmioRegion> regions) {
  for (const auto& region : regions) {
    auto result = AddRegion(region);
    if (!result.has_value()) {
      klog::Warn("BoardConfig: region 0x%lX dropped: %s\n", region.region.base,
                 result.error().message());
    }
  }
}

auto BoardConfig::AddRegion(const BoardMmioRegion& region) -> Expected<void> {
  if (region.region.size == 0) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  if (regions_.full()) {
    return std::unexpected(Error(ErrorCode::kOutOfMemory));
  }
  regions_.push_back(region);
  return {};
}
