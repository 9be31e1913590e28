#pragma once

// blobxl - 把容器中的 CSV 对象合并为一个多工作表 XLSX

#include <string>

#include "blobxl/core/Exception.hpp"
#include "blobxl/core/Expected.hpp"
#include "blobxl/service/RequestHandler.hpp"
#include "blobxl/service/ServiceOptions.hpp"

// 版本信息
#define BLOBXL_VERSION_MAJOR 1
#define BLOBXL_VERSION_MINOR 0
#define BLOBXL_VERSION_PATCH 0
#define BLOBXL_VERSION_STRING "1.0.0"

namespace blobxl {

inline std::string getVersion() {
    return BLOBXL_VERSION_STRING;
}

/**
 * @brief 进程级初始化：日志系统与 libcurl 全局状态
 * @return 失败时返回 false（错误已写到标准错误）
 */
bool initialize(const service::ServiceOptions& options);

/**
 * @brief 与 initialize() 配对调用
 */
void cleanup();

} // namespace blobxl
