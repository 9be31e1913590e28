#include "blobxl/xml/WorksheetXMLGenerator.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"
#include "blobxl/utils/CommonUtils.hpp"
#include <fmt/format.h>

namespace blobxl {
namespace xml {

std::string WorksheetXMLGenerator::formatNumber(double value) {
    return fmt::format("{:.16G}", value);
}

std::string WorksheetXMLGenerator::generate(bool tab_selected) const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("worksheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    writer.startElement("dimension");
    writer.writeAttribute("ref", worksheet_.usedRange());
    writer.endElement(); // dimension

    writer.startElement("sheetViews");
    writer.startElement("sheetView");
    if (tab_selected) {
        writer.writeAttribute("tabSelected", "1");
    }
    writer.writeAttribute("workbookViewId", "0");
    writer.endElement(); // sheetView
    writer.endElement(); // sheetViews

    writer.startElement("sheetFormatPr");
    writer.writeAttribute("defaultRowHeight", "15");
    writer.endElement(); // sheetFormatPr

    writer.startElement("sheetData");
    for (const auto& [row, cells] : worksheet_.cells()) {
        writer.startElement("row");
        writer.writeAttribute("r", row + 1);

        for (const auto& [col, cell] : cells) {
            writer.startElement("c");
            writer.writeAttribute("r", utils::CommonUtils::cellReference(row, col));
            if (cell.style != core::CellStyle::Default) {
                writer.writeAttribute("s", static_cast<int>(cell.style));
            }

            const core::Cell& value = cell.value;
            switch (value.getType()) {
            case core::CellType::String:
                writer.writeAttribute("t", "s");
                writer.startElement("v");
                writer.writeText(std::to_string(shared_strings_.addString(value.getStringValue())));
                writer.endElement(); // v
                break;
            case core::CellType::Boolean:
                writer.writeAttribute("t", "b");
                writer.startElement("v");
                writer.writeText(value.getBooleanValue() ? "1" : "0");
                writer.endElement(); // v
                break;
            case core::CellType::Number:
                writer.startElement("v");
                writer.writeText(formatNumber(value.getNumberValue()));
                writer.endElement(); // v
                break;
            case core::CellType::Empty:
                break;
            }
            writer.endElement(); // c
        }

        writer.endElement(); // row
    }
    writer.endElement(); // sheetData

    writer.startElement("pageMargins");
    writer.writeAttribute("left", "0.7");
    writer.writeAttribute("right", "0.7");
    writer.writeAttribute("top", "0.75");
    writer.writeAttribute("bottom", "0.75");
    writer.writeAttribute("header", "0.3");
    writer.writeAttribute("footer", "0.3");
    writer.endElement(); // pageMargins

    writer.endElement(); // worksheet
    writer.endDocument();
    return writer.takeString();
}

}} // namespace blobxl::xml
