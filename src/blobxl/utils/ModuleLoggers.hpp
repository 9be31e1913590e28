#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    BLOBXL_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     BLOBXL_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     BLOBXL_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    BLOBXL_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// CSV 解析 (csv)
#define CSV_DEBUG(...)     BLOBXL_LOG_DEBUG("[DBG][csv ] " __VA_ARGS__)
#define CSV_INFO(...)      BLOBXL_LOG_INFO("[INF][csv ] " __VA_ARGS__)
#define CSV_WARN(...)      BLOBXL_LOG_WARN("[WRN][csv ] " __VA_ARGS__)
#define CSV_ERROR(...)     BLOBXL_LOG_ERROR("[ERR][csv ] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     BLOBXL_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)      BLOBXL_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)      BLOBXL_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     BLOBXL_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) BLOBXL_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  BLOBXL_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  BLOBXL_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) BLOBXL_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  BLOBXL_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   BLOBXL_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   BLOBXL_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  BLOBXL_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 存储模块 (storage)
#define STORAGE_DEBUG(...) BLOBXL_LOG_DEBUG("[DBG][stor] " __VA_ARGS__)
#define STORAGE_INFO(...)  BLOBXL_LOG_INFO("[INF][stor] " __VA_ARGS__)
#define STORAGE_WARN(...)  BLOBXL_LOG_WARN("[WRN][stor] " __VA_ARGS__)
#define STORAGE_ERROR(...) BLOBXL_LOG_ERROR("[ERR][stor] " __VA_ARGS__)

// 服务编排 (service)
#define SERVICE_DEBUG(...) BLOBXL_LOG_DEBUG("[DBG][svc ] " __VA_ARGS__)
#define SERVICE_INFO(...)  BLOBXL_LOG_INFO("[INF][svc ] " __VA_ARGS__)
#define SERVICE_WARN(...)  BLOBXL_LOG_WARN("[WRN][svc ] " __VA_ARGS__)
#define SERVICE_ERROR(...) BLOBXL_LOG_ERROR("[ERR][svc ] " __VA_ARGS__)
