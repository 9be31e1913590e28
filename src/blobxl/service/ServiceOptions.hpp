#pragma once

#include "blobxl/storage/AzureBlobStore.hpp"
#include "blobxl/utils/Logger.hpp"
#include <string>

namespace blobxl {
namespace service {

/**
 * @brief 服务配置
 *
 * 默认值即生产行为；fromEnvironment() 用 BLOBXL_* 环境变量覆盖。
 */
struct ServiceOptions {
    // 日志
    std::string log_file = "logs/blobxl.log";
    Logger::Level log_level = Logger::Level::INFO;
    bool log_to_console = true;

    // 输入对象筛选
    std::string source_prefix = "csvfiles/";
    std::string source_extension = ".csv";

    // 输出
    int compression_level = 6;

    storage::AzureOptions storage;

    /**
     * @brief 读取环境变量
     *
     * BLOBXL_LOG_FILE, BLOBXL_LOG_LEVEL, BLOBXL_LOG_CONSOLE,
     * BLOBXL_SOURCE_PREFIX, BLOBXL_SOURCE_EXTENSION, BLOBXL_COMPRESSION_LEVEL,
     * BLOBXL_API_VERSION, BLOBXL_SINGLE_PUT_LIMIT, BLOBXL_BLOCK_SIZE,
     * BLOBXL_CONNECT_TIMEOUT, BLOBXL_TIMEOUT, BLOBXL_VERIFY_TLS。
     * 无法解析的值保留默认并记录警告。
     */
    static ServiceOptions fromEnvironment();

    /**
     * @brief 按名字取值的版本，便于测试
     * @param lookup 返回 nullptr 表示未设置
     */
    template<typename Lookup>
    static ServiceOptions fromLookup(Lookup&& lookup);

    /**
     * @brief 应用一项设置
     * @return 名称未知或值无效时返回 false
     */
    bool apply(const std::string& name, const std::string& value);
};

template<typename Lookup>
ServiceOptions ServiceOptions::fromLookup(Lookup&& lookup) {
    static const char* const kNames[] = {
        "BLOBXL_LOG_FILE", "BLOBXL_LOG_LEVEL", "BLOBXL_LOG_CONSOLE",
        "BLOBXL_SOURCE_PREFIX", "BLOBXL_SOURCE_EXTENSION", "BLOBXL_COMPRESSION_LEVEL",
        "BLOBXL_API_VERSION", "BLOBXL_SINGLE_PUT_LIMIT", "BLOBXL_BLOCK_SIZE",
        "BLOBXL_CONNECT_TIMEOUT", "BLOBXL_TIMEOUT", "BLOBXL_VERIFY_TLS"
    };
    ServiceOptions options;
    for (const char* name : kNames) {
        const char* value = lookup(name);
        if (value != nullptr) {
            options.apply(name, value);
        }
    }
    return options;
}

}} // namespace blobxl::service
