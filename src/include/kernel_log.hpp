/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 日志相关函数
 */

#ifndef HWPROBE_SRC_INCLUDE_KERNEL_LOG_HPP_
#define HWPROBE_SRC_INCLUDE_KERNEL_LOG_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <source_location>
#include <utility>

#include "config.h"

namespace klog {

enum LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kErr,
  kLogLevelMax,
};

/// 日志输出函数，接收一条已格式化、以 '\0' 结尾的日志
using OutputFunction = void (*)(const char* line);

/**
 * @brief 替换日志输出
 * @param  output         输出函数，nullptr 恢复默认输出 (stderr)
 */
auto SetOutput(OutputFunction output) -> void;

/**
 * @brief 设置最低输出等级，低于该等级的日志被丢弃
 * @param  level          最低等级
 */
auto SetLevel(LogLevel level) -> void;

[[nodiscard]] auto GetLevel() -> LogLevel;

namespace detail {

/// ANSI 转义码，在支持 ANSI 转义码的终端中可以显示颜色
static constexpr const auto kReset = "\033[0m";
static constexpr const auto kRed = "\033[31m";
static constexpr const auto kGreen = "\033[32m";
static constexpr const auto kYellow = "\033[33m";
static constexpr const auto kBlue = "\033[34m";
static constexpr const auto kMagenta = "\033[35m";
static constexpr const auto kCyan = "\033[36m";
static constexpr const auto kWhite = "\033[37m";

constexpr std::array<const char*, kLogLevelMax> kLogColors = {
    // kDebug
    detail::kMagenta,
    // kInfo
    detail::kCyan,
    // kWarn
    detail::kYellow,
    // kErr
    detail::kRed,
};

/**
 * @brief 格式化一条日志并写入当前输出
 * @param  level          日志等级
 * @param  function       调用者函数名，nullptr 时不输出
 * @param  fmt            printf 风格格式串
 */
__attribute__((format(printf, 3, 4))) auto Emit(LogLevel level,
                                                const char* function,
                                                const char* fmt, ...) -> void;

template <LogLevel Level, typename... Args>
struct LogBase {
  explicit LogBase(Args&&... args,
                   [[maybe_unused]] const std::source_location& location =
                       std::source_location::current()) {
    if (Level < GetLevel()) {
      return;
    }
    if constexpr (Level == kDebug && kHwProbeDebugLog) {
      Emit(Level, location.function_name(), std::forward<Args>(args)...);
    } else {
      Emit(Level, nullptr, std::forward<Args>(args)...);
    }
  }
};

}  // namespace detail

template <typename... Args>
struct Debug : public detail::LogBase<kDebug, Args...> {
  explicit Debug(Args&&... args, const std::source_location& location =
                                     std::source_location::current())
      : detail::LogBase<kDebug, Args...>(std::forward<Args>(args)...,
                                                 location) {}
};
template <typename... Args>
Debug(Args&&...) -> Debug<Args...>;

template <typename... Args>
struct Info : public detail::LogBase<kInfo, Args...> {
  explicit Info(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<kInfo, Args...>(std::forward<Args>(args)...,
                                                location) {}
};
template <typename... Args>
Info(Args&&...) -> Info<Args...>;

template <typename... Args>
struct Warn : public detail::LogBase<kWarn, Args...> {
  explicit Warn(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<kWarn, Args...>(std::forward<Args>(args)...,
                                                location) {}
};
template <typename... Args>
Warn(Args&&...) -> Warn<Args...>;

template <typename... Args>
struct Err : public detail::LogBase<kErr, Args...> {
  explicit Err(Args&&... args, const std::source_location& location =
                                   std::source_location::current())
      : detail::LogBase<kErr, Args...>(std::forward<Args>(args)...,
                                               location) {}
};
template <typename... Args>
Err(Args&&...) -> Err<Args...>;

}  // namespace klog

#endif /* HWPROBE_SRC_INCLUDE_KERNEL_LOG_HPP_ */
