#pragma once

#include <string>
#include <cstdint>

namespace blobxl {
namespace utils {

/**
 * @brief 通用工具类 - 单元格引用等
 */
class CommonUtils {
public:
    /**
     * @brief 列号转换为字母表示（A, B, ..., Z, AA, AB, ...）
     * @param col 列号（0开始）
     */
    static std::string columnToLetter(uint32_t col) {
        std::string result;
        int64_t c = col;
        while (c >= 0) {
            result.insert(result.begin(), static_cast<char>('A' + (c % 26)));
            c = c / 26 - 1;
        }
        return result;
    }

    /**
     * @brief 生成单元格引用（如A1, B2等）
     * @param row 行号（0开始）
     * @param col 列号（0开始）
     */
    static std::string cellReference(uint32_t row, uint32_t col) {
        return columnToLetter(col) + std::to_string(static_cast<uint64_t>(row) + 1);
    }

    static std::string rangeReference(uint32_t first_row, uint32_t first_col, uint32_t last_row, uint32_t last_col) {
        return cellReference(first_row, first_col) + ":" + cellReference(last_row, last_col);
    }
};

}} // namespace blobxl::utils
