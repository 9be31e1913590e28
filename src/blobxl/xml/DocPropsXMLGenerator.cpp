#include "blobxl/xml/DocPropsXMLGenerator.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace blobxl {
namespace xml {

std::string DocPropsXMLGenerator::formatTimeISO8601(std::time_t time) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time);
#else
    gmtime_r(&time, &utc);
#endif
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", utc);
}

std::string DocPropsXMLGenerator::generateCoreXML(const core::Workbook& workbook, std::time_t created) {
    const auto& props = workbook.properties();
    const std::string timestamp = formatTimeISO8601(created);

    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("cp:coreProperties");
    writer.writeAttribute("xmlns:cp", "http://schemas.openxmlformats.org/package/2006/metadata/core-properties");
    writer.writeAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    writer.writeAttribute("xmlns:dcterms", "http://purl.org/dc/terms/");
    writer.writeAttribute("xmlns:dcmitype", "http://purl.org/dc/dcmitype/");
    writer.writeAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");

    if (!props.title.empty()) {
        writer.startElement("dc:title");
        writer.writeText(props.title);
        writer.endElement(); // dc:title
    }

    writer.startElement("dc:creator");
    writer.writeText(props.author);
    writer.endElement(); // dc:creator

    writer.startElement("cp:lastModifiedBy");
    writer.writeText(props.author);
    writer.endElement(); // cp:lastModifiedBy

    writer.startElement("dcterms:created");
    writer.writeAttribute("xsi:type", "dcterms:W3CDTF");
    writer.writeText(timestamp);
    writer.endElement(); // dcterms:created

    writer.startElement("dcterms:modified");
    writer.writeAttribute("xsi:type", "dcterms:W3CDTF");
    writer.writeText(timestamp);
    writer.endElement(); // dcterms:modified

    writer.endElement(); // cp:coreProperties
    writer.endDocument();
    return writer.takeString();
}

std::string DocPropsXMLGenerator::generateAppXML(const core::Workbook& workbook) {
    const auto sheet_names = workbook.getSheetNames();

    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Properties");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties");
    writer.writeAttribute("xmlns:vt", "http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes");

    writer.startElement("Application");
    writer.writeText(workbook.properties().application);
    writer.endElement(); // Application

    writer.startElement("DocSecurity");
    writer.writeText("0");
    writer.endElement(); // DocSecurity

    writer.startElement("ScaleCrop");
    writer.writeText("false");
    writer.endElement(); // ScaleCrop

    writer.startElement("HeadingPairs");
    writer.startElement("vt:vector");
    writer.writeAttribute("size", "2");
    writer.writeAttribute("baseType", "variant");
    writer.startElement("vt:variant");
    writer.startElement("vt:lpstr");
    writer.writeText("Worksheets");
    writer.endElement(); // vt:lpstr
    writer.endElement(); // vt:variant
    writer.startElement("vt:variant");
    writer.startElement("vt:i4");
    writer.writeText(std::to_string(sheet_names.size()));
    writer.endElement(); // vt:i4
    writer.endElement(); // vt:variant
    writer.endElement(); // vt:vector
    writer.endElement(); // HeadingPairs

    writer.startElement("TitlesOfParts");
    writer.startElement("vt:vector");
    writer.writeAttribute("size", sheet_names.size());
    writer.writeAttribute("baseType", "lpstr");
    for (const auto& name : sheet_names) {
        writer.startElement("vt:lpstr");
        writer.writeText(name);
        writer.endElement(); // vt:lpstr
    }
    writer.endElement(); // vt:vector
    writer.endElement(); // TitlesOfParts

    writer.startElement("LinksUpToDate");
    writer.writeText("false");
    writer.endElement(); // LinksUpToDate

    writer.startElement("SharedDoc");
    writer.writeText("false");
    writer.endElement(); // SharedDoc

    writer.startElement("HyperlinksChanged");
    writer.writeText("false");
    writer.endElement(); // HyperlinksChanged

    writer.startElement("AppVersion");
    writer.writeText("12.0000");
    writer.endElement(); // AppVersion

    writer.endElement(); // Properties
    writer.endDocument();
    return writer.takeString();
}

}} // namespace blobxl::xml
