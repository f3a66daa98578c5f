/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#ifndef HWPROBE_SRC_INCLUDE_EXPECTED_HPP_
#define HWPROBE_SRC_INCLUDE_EXPECTED_HPP_

#include <cstdint>
#include <expected>

/// 错误码
enum class ErrorCode : uint64_t {
  kSuccess = 0,
  // FDT 相关错误 (0x200 - 0x2FF)
  kFdtInvalidAddress = 0x200,
  kFdtInvalidHeader = 0x201,
  kFdtNodeNotFound = 0x202,
  kFdtPropertyNotFound = 0x203,
  kFdtParseFailed = 0x204,
  kFdtInvalidPropertySize = 0x205,
  // 驱动注册表相关错误 (0x700 - 0x7FF)
  kRegistrySealed = 0x700,
  kRegistryFull = 0x701,
  kRegistryNotSealed = 0x702,
  kDriverAlreadyRegistered = 0x703,
  kDriverClassMismatch = 0x704,
  // 设备相关错误 (0x800 - 0x8FF)
  kDeviceInitFailed = 0x801,
  kDeviceNotReady = 0x802,
  kDeviceOutOfRange = 0x803,
  // PCI 相关错误 (0x900 - 0x9FF)
  kPciEnumerationFailed = 0x900,
  kPciBarNotPresent = 0x901,
  kPciInvalidBarIndex = 0x902,
  // DMA / MMIO 相关错误 (0xA00 - 0xAFF)
  kMmioOutOfWindow = 0xA01,
  kMmioUnaligned = 0xA02,
  // 通用错误 (0xF00 - 0xFFF)
  kInvalidArgument = 0xF00,
  kOutOfMemory = 0xF01,
};

/// 获取错误码对应的错误信息
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kFdtInvalidAddress:
      return "Invalid FDT address";
    case ErrorCode::kFdtInvalidHeader:
      return "Invalid FDT header";
    case ErrorCode::kFdtNodeNotFound:
      return "FDT node not found";
    case ErrorCode::kFdtPropertyNotFound:
      return "FDT property not found";
    case ErrorCode::kFdtParseFailed:
      return "FDT parse failed";
    case ErrorCode::kFdtInvalidPropertySize:
      return "Invalid FDT property size";
    case ErrorCode::kRegistrySealed:
      return "Driver registry is sealed";
    case ErrorCode::kRegistryFull:
      return "Driver registry is full";
    case ErrorCode::kRegistryNotSealed:
      return "Driver registry is not sealed";
    case ErrorCode::kDriverAlreadyRegistered:
      return "Driver already registered";
    case ErrorCode::kDriverClassMismatch:
      return "Driver registered under the wrong device class";
    case ErrorCode::kDeviceInitFailed:
      return "Device initialization failed";
    case ErrorCode::kDeviceNotReady:
      return "Device did not reach ready state";
    case ErrorCode::kDeviceOutOfRange:
      return "Block address out of device range";
    case ErrorCode::kPciEnumerationFailed:
      return "PCI enumeration failed";
    case ErrorCode::kPciBarNotPresent:
      return "PCI BAR not present";
    case ErrorCode::kPciInvalidBarIndex:
      return "Invalid PCI BAR index";
    case ErrorCode::kMmioOutOfWindow:
      return "MMIO access outside register window";
    case ErrorCode::kMmioUnaligned:
      return "Unaligned MMIO access";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfMemory:
      return "Out of memory";
    default:
      return "Unknown error";
  }
}

/// 错误类型，用于 std::expected
struct Error {
  ErrorCode code;

  constexpr Error(ErrorCode c) : code(c) {}

  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }
};

/// std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

#endif /* HWPROBE_SRC_INCLUDE_EXPECTED_HPP_ */
