/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 配置文件
 */

#ifndef HWPROBE_SRC_INCLUDE_CONFIG_H_
#define HWPROBE_SRC_INCLUDE_CONFIG_H_

#include "../project_config.h"

#endif /* HWPROBE_SRC_INCLUDE_CONFIG_H_ */
