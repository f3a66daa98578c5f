/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief ETL configuration for HwProbe.
 */

#ifndef HWPROBE_SRC_INCLUDE_ETL_PROFILE_H_
#define HWPROBE_SRC_INCLUDE_ETL_PROFILE_H_

// Use generic C++23 profile as base
#define ETL_CPP23_SUPPORTED 1

// 探测路径不抛异常，容量溢出由调用方检查 full()
#define ETL_NO_EXCEPTIONS 1

#endif  // HWPROBE_SRC_INCLUDE_ETL_PROFILE_H_
