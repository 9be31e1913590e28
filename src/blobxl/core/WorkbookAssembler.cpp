#include "blobxl/core/WorkbookAssembler.hpp"
#include "blobxl/utils/Logger.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"

namespace blobxl {
namespace core {

namespace {
constexpr const char* kSeparator = "---------------------------------------------";
}

std::unique_ptr<Workbook> WorkbookAssembler::assemble(const TableSet& tables) {
    auto workbook = std::make_unique<Workbook>();
    placements_.clear();
    placements_.reserve(tables.size());

    BLOBXL_LOG_INFO("These files have a character length greater than 33:");

    for (const auto& [key, table] : tables) {
        SheetPlacement placement = namer_.place(key);
        if (placement.shortened) {
            BLOBXL_LOG_INFO("{}", placement.candidate);
            BLOBXL_LOG_INFO("{}", kSeparator);
            BLOBXL_LOG_INFO("{}", placement.sheet_name);
        }

        auto sheet = workbook->addSheet(placement.sheet_name);
        writeTable(*sheet, table, placement.write_index);
        CORE_DEBUG("Wrote '{}' to sheet '{}' ({} rows, {} columns)", key, sheet->getName(),
                   table.rowCount(), table.columnCount());
        if (sheet->skippedCells() > 0) {
            CORE_WARN("Sheet '{}': {} cells fell outside the sheet limits and were skipped",
                      sheet->getName(), sheet->skippedCells());
        }
        placements_.push_back(std::move(placement));
    }

    BLOBXL_LOG_INFO("These tabs are now named above:");
    BLOBXL_LOG_INFO("Job Complete!");
    return workbook;
}

void WorkbookAssembler::writeTable(Worksheet& sheet, const Table& table, bool write_index) {
    const uint32_t first_col = write_index ? 1u : 0u;

    for (size_t c = 0; c < table.columnCount(); ++c) {
        sheet.writeCell(0, first_col + static_cast<uint32_t>(c), Cell::string(table.columns()[c]),
                        CellStyle::Header);
    }

    for (size_t r = 0; r < table.rowCount(); ++r) {
        const uint32_t row = static_cast<uint32_t>(r + 1);
        if (write_index) {
            sheet.writeCell(row, 0, Cell::number(static_cast<double>(r)), CellStyle::Header);
        }
        const auto& cells = table.rows()[r];
        for (size_t c = 0; c < cells.size(); ++c) {
            if (cells[c].isEmpty()) {
                continue;
            }
            sheet.writeCell(row, first_col + static_cast<uint32_t>(c), cells[c]);
        }
    }
}

}} // namespace blobxl::core
