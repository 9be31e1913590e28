#pragma once

#include "blobxl/core/Worksheet.hpp"
#include "blobxl/xml/SharedStrings.hpp"
#include <string>

namespace blobxl {
namespace xml {

/**
 * @brief 生成 xl/worksheets/sheetN.xml
 *
 * 字符串单元格写入共享字符串表并以 t="s" 引用；数字最多保留16位有效数字；
 * 布尔值使用 t="b"；带样式的空单元格只输出 s 属性。
 */
class WorksheetXMLGenerator {
public:
    WorksheetXMLGenerator(const core::Worksheet& worksheet, SharedStrings& shared_strings)
        : worksheet_(worksheet), shared_strings_(shared_strings) {}

    /**
     * @param tab_selected 是否为打开工作簿时选中的工作表
     */
    std::string generate(bool tab_selected) const;

    static std::string formatNumber(double value);

private:
    const core::Worksheet& worksheet_;
    SharedStrings& shared_strings_;
};

}} // namespace blobxl::xml
