/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "kernel_log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace klog {
namespace {

auto DefaultOutput(const char* line) -> void { std::fputs(line, stderr); }

std::atomic<OutputFunction> output{&DefaultOutput};
std::atomic<LogLevel> min_level{kHwProbeDebugLog ? kDebug : kInfo};

}  // namespace

auto SetOutput(OutputFunction fn) -> void {
  output.store(fn != nullptr ? fn : &DefaultOutput, std::memory_order_release);
}

auto SetLevel(LogLevel level) -> void {
  min_level.store(level, std::memory_order_release);
}

auto GetLevel() -> LogLevel { return min_level.load(std::memory_order_acquire); }

namespace detail {

auto Emit(LogLevel level, const char* function, const char* fmt, ...) -> void {
  // 单条日志的上限，超出部分截断
  static constexpr size_t kLineMax = 512;
  char line[kLineMax];

  int pos = 0;
  if (function != nullptr) {
    pos = std::snprintf(line, sizeof(line), "%s[%s] ", kLogColors[level],
                        function);
  } else {
    pos = std::snprintf(line, sizeof(line), "%s", kLogColors[level]);
  }
  if (pos < 0) {
    return;
  }

  auto used = static_cast<size_t>(pos) < sizeof(line) ? static_cast<size_t>(pos)
                                                      : sizeof(line) - 1;
  va_list args;
  va_start(args, fmt);
  int len = std::vsnprintf(line + used, sizeof(line) - used, fmt, args);
  va_end(args);
  if (len > 0) {
    used += static_cast<size_t>(len);
    if (used >= sizeof(line)) {
      used = sizeof(line) - 1;
    }
  }

  // 保证颜色复位一定写入
  static constexpr size_t kResetLen = 4;
  if (used + kResetLen >= sizeof(line)) {
    used = sizeof(line) - kResetLen - 1;
  }
  std::snprintf(line + used, sizeof(line) - used, "%s", kReset);

  output.load(std::memory_order_acquire)(line);
}

}  // namespace detail
}  // namespace klog
