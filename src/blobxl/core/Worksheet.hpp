#pragma once

#include "blobxl/core/Cell.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace blobxl {
namespace core {

// 内置样式：0 为默认样式，1 为表头样式（加粗、细边框、水平居中、顶端对齐）
enum class CellStyle : uint8_t {
    Default = 0,
    Header = 1
};

struct StyledCell {
    Cell value;
    CellStyle style = CellStyle::Default;
};

/**
 * @brief 稀疏存储的工作表
 *
 * 同一位置重复写入时后写覆盖先写。
 */
class Worksheet {
public:
    static constexpr uint32_t kMaxRows = 1048576;
    static constexpr uint32_t kMaxColumns = 16384;
    static constexpr size_t kMaxStringLength = 32767;

    using RowCells = std::map<uint32_t, StyledCell>;
    using CellMap = std::map<uint32_t, RowCells>;

    Worksheet(std::string name, uint32_t sheet_id);

    const std::string& getName() const { return name_; }
    uint32_t getSheetId() const { return sheet_id_; }

    /**
     * @brief 写入单元格
     * @return 越界时不写入并返回 false
     */
    bool writeCell(uint32_t row, uint32_t col, const Cell& value, CellStyle style = CellStyle::Default);

    /**
     * @brief 带样式的空单元格；无样式的空值不占位
     */
    bool writeBlank(uint32_t row, uint32_t col, CellStyle style);

    const StyledCell* getCell(uint32_t row, uint32_t col) const;

    const CellMap& cells() const { return cells_; }
    bool isEmpty() const { return cells_.empty(); }

    /**
     * @brief 已使用区域，如 "A1:C10"；空表返回 "A1"
     */
    std::string usedRange() const;

    size_t skippedCells() const { return skipped_cells_; }

private:
    std::string name_;
    uint32_t sheet_id_;
    CellMap cells_;
    size_t skipped_cells_ = 0;
};

}} // namespace blobxl::core
