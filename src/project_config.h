/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief project_config 头文件，编译开关由 CMake 以宏定义传入
 */

#ifndef HWPROBE_SRC_PROJECT_CONFIG_H_
#define HWPROBE_SRC_PROJECT_CONFIG_H_

#include <cstdint>

#ifdef HWPROBE_DEBUG
static constexpr const auto kHwProbeDebugLog = true;
#else
static constexpr const auto kHwProbeDebugLog = false;
#endif

#endif /* HWPROBE_SRC_PROJECT_CONFIG_H_ */
