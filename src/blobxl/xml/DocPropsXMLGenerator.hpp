#pragma once

#include "blobxl/core/Workbook.hpp"
#include <ctime>
#include <string>

namespace blobxl {
namespace xml {

/**
 * @brief 文档属性 XML 生成器（docProps/core.xml、docProps/app.xml）
 */
class DocPropsXMLGenerator {
public:
    /**
     * @brief 生成 core.xml
     * @param created 创建与修改时间（UTC）
     */
    static std::string generateCoreXML(const core::Workbook& workbook, std::time_t created);

    /**
     * @brief 生成 app.xml，包含工作表名列表
     */
    static std::string generateAppXML(const core::Workbook& workbook);

    // 格式化为 W3CDTF，如 2024-01-31T08:00:00Z
    static std::string formatTimeISO8601(std::time_t time);
};

}} // namespace blobxl::xml
