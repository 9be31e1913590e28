#include "blobxl/core/Worksheet.hpp"
#include "blobxl/utils/CommonUtils.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"
#include <algorithm>
#include <limits>

namespace blobxl {
namespace core {

Worksheet::Worksheet(std::string name, uint32_t sheet_id)
    : name_(std::move(name)), sheet_id_(sheet_id) {
}

bool Worksheet::writeCell(uint32_t row, uint32_t col, const Cell& value, CellStyle style) {
    if (row >= kMaxRows || col >= kMaxColumns) {
        if (skipped_cells_++ == 0) {
            CORE_WARN("Worksheet '{}': cell {} is outside the sheet limits, skipping", name_,
                      utils::CommonUtils::cellReference(std::min(row, kMaxRows - 1), std::min(col, kMaxColumns - 1)));
        }
        return false;
    }

    if (value.isEmpty()) {
        // 空值只在带样式时占位，否则清除原有内容
        if (style == CellStyle::Default) {
            auto row_it = cells_.find(row);
            if (row_it != cells_.end()) {
                row_it->second.erase(col);
                if (row_it->second.empty()) {
                    cells_.erase(row_it);
                }
            }
            return true;
        }
        return writeBlank(row, col, style);
    }

    StyledCell& target = cells_[row][col];
    target.style = style;
    if (value.isString() && value.getStringValue().size() > kMaxStringLength &&
        utils::TextUtils::codePointLength(value.getStringValue()) > kMaxStringLength) {
        CORE_WARN("Worksheet '{}': string at {} exceeds {} characters, truncating", name_,
                  utils::CommonUtils::cellReference(row, col), kMaxStringLength);
        target.value = Cell::string(utils::TextUtils::truncateCodePoints(value.getStringValue(), kMaxStringLength));
    } else {
        target.value = value;
    }
    return true;
}

bool Worksheet::writeBlank(uint32_t row, uint32_t col, CellStyle style) {
    if (row >= kMaxRows || col >= kMaxColumns) {
        ++skipped_cells_;
        return false;
    }
    StyledCell& target = cells_[row][col];
    target.value = Cell();
    target.style = style;
    return true;
}

const StyledCell* Worksheet::getCell(uint32_t row, uint32_t col) const {
    auto row_it = cells_.find(row);
    if (row_it == cells_.end()) {
        return nullptr;
    }
    auto col_it = row_it->second.find(col);
    return col_it == row_it->second.end() ? nullptr : &col_it->second;
}

std::string Worksheet::usedRange() const {
    if (cells_.empty()) {
        return "A1";
    }
    uint32_t first_col = std::numeric_limits<uint32_t>::max();
    uint32_t last_col = 0;
    for (const auto& [row, row_cells] : cells_) {
        first_col = std::min(first_col, row_cells.begin()->first);
        last_col = std::max(last_col, row_cells.rbegin()->first);
    }
    const uint32_t first_row = cells_.begin()->first;
    const uint32_t last_row = cells_.rbegin()->first;
    if (first_row == last_row && first_col == last_col) {
        return utils::CommonUtils::cellReference(first_row, first_col);
    }
    return utils::CommonUtils::rangeReference(first_row, first_col, last_row, last_col);
}

}} // namespace blobxl::core
