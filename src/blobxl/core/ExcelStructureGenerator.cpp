#include "blobxl/core/ExcelStructureGenerator.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/archive/ZipWriter.hpp"
#include "blobxl/xml/ContentTypes.hpp"
#include "blobxl/xml/DocPropsXMLGenerator.hpp"
#include "blobxl/xml/Relationships.hpp"
#include "blobxl/xml/SharedStrings.hpp"
#include "blobxl/xml/StyleSerializer.hpp"
#include "blobxl/xml/WorksheetXMLGenerator.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace blobxl {
namespace core {

namespace {

constexpr const char* kRelOfficeDocument = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* kRelCoreProperties = "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties";
constexpr const char* kRelExtendedProperties = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties";
constexpr const char* kRelWorksheet = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char* kRelStyles = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
constexpr const char* kRelSharedStrings = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings";

void addPart(archive::ZipWriter& zip, const std::string& path, const std::string& content) {
    const archive::ZipError result = zip.addFile(path, content);
    if (archive::isError(result)) {
        throw SerializationException(fmt::format("Failed to add {} to the workbook archive: {}",
                                                 path, archive::toString(result)),
                                     "", ErrorCode::ZipError, __FILE__, __LINE__);
    }
}

} // namespace

ExcelStructureGenerator::ExcelStructureGenerator(int compression_level)
    : compression_level_(compression_level) {
}

std::vector<uint8_t> ExcelStructureGenerator::generate(const Workbook& workbook) const {
    if (workbook.getSheetCount() == 0) {
        throw SerializationException("Workbook contains no worksheets", "", ErrorCode::SerializationFailed,
                                     __FILE__, __LINE__);
    }

    archive::ZipWriter zip;
    if (archive::isError(zip.setCompressionLevel(compression_level_))) {
        throw SerializationException(fmt::format("Invalid compression level {}", compression_level_),
                                     "", ErrorCode::ZipError, __FILE__, __LINE__);
    }
    if (!zip.open()) {
        throw SerializationException("Failed to create the workbook archive", "", ErrorCode::ZipError,
                                     __FILE__, __LINE__);
    }

    // 工作表先于共享字符串生成，以便收集所有字符串
    xml::SharedStrings shared_strings;
    std::vector<std::string> sheet_xml;
    sheet_xml.reserve(workbook.getSheetCount());
    for (size_t i = 0; i < workbook.getSheetCount(); ++i) {
        xml::WorksheetXMLGenerator generator(*workbook.worksheets()[i], shared_strings);
        sheet_xml.push_back(generator.generate(i == 0));
    }

    const std::time_t created = created_time_ != 0 ? created_time_ : std::time(nullptr);

    addPart(zip, "[Content_Types].xml", generateContentTypesXML(workbook));
    addPart(zip, "_rels/.rels", generateRootRelsXML());
    addPart(zip, "docProps/app.xml", xml::DocPropsXMLGenerator::generateAppXML(workbook));
    addPart(zip, "docProps/core.xml", xml::DocPropsXMLGenerator::generateCoreXML(workbook, created));
    addPart(zip, "xl/workbook.xml", generateWorkbookXML(workbook));
    addPart(zip, "xl/_rels/workbook.xml.rels", generateWorkbookRelsXML(workbook));
    addPart(zip, "xl/styles.xml", xml::StyleSerializer::generate());
    addPart(zip, "xl/sharedStrings.xml", shared_strings.generate());
    for (size_t i = 0; i < sheet_xml.size(); ++i) {
        addPart(zip, worksheetPath(i), sheet_xml[i]);
    }

    if (!zip.close()) {
        throw SerializationException("Failed to finalize the workbook archive", "", ErrorCode::ZipError,
                                     __FILE__, __LINE__);
    }

    std::vector<uint8_t> bytes = zip.takeBuffer();
    CORE_DEBUG("Serialized workbook: {} sheets, {} shared strings, {} bytes",
               workbook.getSheetCount(), shared_strings.size(), bytes.size());
    return bytes;
}

std::string ExcelStructureGenerator::worksheetPath(size_t index) {
    return fmt::format("xl/worksheets/sheet{}.xml", index + 1);
}

std::string ExcelStructureGenerator::generateContentTypesXML(const Workbook& workbook) {
    xml::ContentTypes content_types;
    content_types.addExcelDefaults();
    content_types.addOverride("/docProps/app.xml", "application/vnd.openxmlformats-officedocument.extended-properties+xml");
    content_types.addOverride("/docProps/core.xml", "application/vnd.openxmlformats-package.core-properties+xml");
    content_types.addOverride("/xl/styles.xml", "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml");
    content_types.addOverride("/xl/workbook.xml", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml");
    for (size_t i = 0; i < workbook.getSheetCount(); ++i) {
        content_types.addOverride("/" + worksheetPath(i),
                                  "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml");
    }
    content_types.addOverride("/xl/sharedStrings.xml", "application/vnd.openxmlformats-officedocument.spreadsheetml.sharedStrings+xml");
    return content_types.generate();
}

std::string ExcelStructureGenerator::generateRootRelsXML() {
    xml::Relationships rels;
    rels.addRelationship(kRelOfficeDocument, "xl/workbook.xml");
    rels.addRelationship(kRelCoreProperties, "docProps/core.xml");
    rels.addRelationship(kRelExtendedProperties, "docProps/app.xml");
    return rels.generate();
}

std::string ExcelStructureGenerator::generateWorkbookRelsXML(const Workbook& workbook) {
    xml::Relationships rels;
    for (size_t i = 0; i < workbook.getSheetCount(); ++i) {
        rels.addRelationship(kRelWorksheet, fmt::format("worksheets/sheet{}.xml", i + 1));
    }
    rels.addRelationship(kRelStyles, "styles.xml");
    rels.addRelationship(kRelSharedStrings, "sharedStrings.xml");
    return rels.generate();
}

std::string ExcelStructureGenerator::generateWorkbookXML(const Workbook& workbook) {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("workbook");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    writer.startElement("fileVersion");
    writer.writeAttribute("appName", "xl");
    writer.writeAttribute("lastEdited", "4");
    writer.writeAttribute("lowestEdited", "4");
    writer.writeAttribute("rupBuild", "4505");
    writer.endElement(); // fileVersion

    writer.startElement("workbookPr");
    writer.writeAttribute("defaultThemeVersion", "124226");
    writer.endElement(); // workbookPr

    writer.startElement("bookViews");
    writer.startElement("workbookView");
    writer.writeAttribute("xWindow", "240");
    writer.writeAttribute("yWindow", "15");
    writer.writeAttribute("windowWidth", "16095");
    writer.writeAttribute("windowHeight", "9660");
    writer.endElement(); // workbookView
    writer.endElement(); // bookViews

    writer.startElement("sheets");
    // 工作表关系 id 与 generateWorkbookRelsXML 的添加顺序一致
    for (size_t i = 0; i < workbook.getSheetCount(); ++i) {
        writer.startElement("sheet");
        writer.writeAttribute("name", workbook.worksheets()[i]->getName());
        writer.writeAttribute("sheetId", i + 1);
        writer.writeAttribute("r:id", fmt::format("rId{}", i + 1));
        writer.endElement(); // sheet
    }
    writer.endElement(); // sheets

    writer.startElement("calcPr");
    writer.writeAttribute("calcId", "124519");
    writer.writeAttribute("fullCalcOnLoad", "1");
    writer.endElement(); // calcPr

    writer.endElement(); // workbook
    writer.endDocument();
    return writer.takeString();
}

}} // namespace blobxl::core
