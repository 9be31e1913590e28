#pragma once

#include <string>

namespace blobxl {
namespace xml {

/**
 * @brief 生成 xl/styles.xml
 *
 * 只有两个单元格格式：
 * - xf 0：默认格式
 * - xf 1：表头格式（加粗字体、四边细边框、水平居中、顶端对齐），与 core::CellStyle::Header 对应
 */
class StyleSerializer {
public:
    static std::string generate();
};

}} // namespace blobxl::xml
