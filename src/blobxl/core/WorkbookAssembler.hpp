#pragma once

#include "blobxl/core/SheetNamer.hpp"
#include "blobxl/core/Table.hpp"
#include "blobxl/core/Workbook.hpp"
#include <memory>
#include <vector>

namespace blobxl {
namespace core {

/**
 * @brief 把 TableSet 组装成多工作表工作簿
 *
 * 每个 (键, 表) 对应一张工作表，名字由 SheetNamer 决定。
 * 表头单元格与行号单元格使用表头样式，数据单元格无样式。
 */
class WorkbookAssembler {
public:
    WorkbookAssembler() = default;

    /**
     * @brief 组装工作簿
     * @throws SerializationException 工作表名被拒绝
     */
    std::unique_ptr<Workbook> assemble(const TableSet& tables);

    /**
     * @brief 上一次组装时每张表的落位（按 TableSet 顺序）
     */
    const std::vector<SheetPlacement>& placements() const { return placements_; }

    /**
     * @brief 把一张表写入工作表
     * @param write_index 为 true 时 A 列输出从 0 开始的行号，表数据从 B 列开始
     */
    static void writeTable(Worksheet& sheet, const Table& table, bool write_index);

private:
    SheetNamer namer_;
    std::vector<SheetPlacement> placements_;
};

}} // namespace blobxl::core
