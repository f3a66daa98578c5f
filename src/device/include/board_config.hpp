/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 板级配置：固定 MMIO 区域及其驱动族
 */

#ifndef HWPROBE_SRC_DEVICE_INCLUDE_BOARD_CONFIG_HPP_
#define HWPROBE_SRC_DEVICE_INCLUDE_BOARD_CONFIG_HPP_

#include <etl/vector.h>

#include <initializer_list>

#include "bus_descriptor.hpp"
#include "driver_probe.hpp"
#include "expected.hpp"
#include "hwprobe_config.hpp"

/// 一个固定 MMIO 区域
struct BoardMmioRegion {
  MmioRegion region;
  /// 预期在该区域上的驱动族
  DriverFamily family;
};

/**
 * @brief 板级配置
 *
 * MMIO 区域是板级常量，来自静态表或设备树，不在运行期探测得到。
 */
class BoardConfig {
 public:
  using RegionList =
      etl::vector<BoardMmioRegion, hwprobe::config::kMaxBoardRegions>;

  BoardConfig() = default;

  /// 从静态表构造，超出容量的区域被丢弃并记录警告
  BoardConfig(std::initializer_list<BoardMmioRegion> regions);

  /**
   * @brief 追加一个区域
   * @return Expected<void> 容量已满时返回 kOutOfMemory，
   *                        size 为 0 时返回 kInvalidArgument
   */
  auto AddRegion(const BoardMmioRegion& region) -> Expected<void>;

  [[nodiscard]] auto GetRegions() const -> const RegionList& {
    return regions_;
  }

 private:
  RegionList regions_;
};

#endif  // HWPROBE_SRC_DEVICE_INCLUDE_BOARD_CONFIG_HPP_
