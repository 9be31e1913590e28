#pragma once

#include <string>
#include <cstddef>

namespace blobxl {
namespace core {

/**
 * @brief 一张表在工作簿中的落位方式
 */
struct SheetPlacement {
    std::string source_key;     // TableSet 键，如 "sales.csv"
    std::string candidate;      // 去掉扩展名后的名字
    std::string sheet_name;     // 最终工作表名（可能为空，交由工作簿分配默认名）
    bool shortened = false;     // candidate 超长被缩短
    bool write_index = false;   // 是否输出从0开始的行号列
};

/**
 * @brief 工作表命名策略
 *
 * 不超过 31 个字符的名字原样使用且不输出行号列；
 * 超长名字按单词边界缩短到 30 个字符以内（无占位符），并输出行号列。
 * 缩短后的名字不去重。
 */
class SheetNamer {
public:
    static constexpr size_t kMaxSheetNameLength = 31;
    static constexpr size_t kShortenWidth = 30;

    SheetPlacement place(const std::string& source_key) const;
};

}} // namespace blobxl::core
