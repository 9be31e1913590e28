#include "blobxl/xml/ContentTypes.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"

namespace blobxl {
namespace xml {

void ContentTypes::addDefault(const std::string& extension, const std::string& content_type) {
    default_types_.push_back({extension, content_type});
}

void ContentTypes::addOverride(const std::string& part_name, const std::string& content_type) {
    override_types_.push_back({part_name, content_type});
}

void ContentTypes::addExcelDefaults() {
    addDefault("rels", "application/vnd.openxmlformats-package.relationships+xml");
    addDefault("xml", "application/xml");
}

std::string ContentTypes::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Types");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    for (const auto& def : default_types_) {
        writer.startElement("Default");
        writer.writeAttribute("Extension", def.extension);
        writer.writeAttribute("ContentType", def.content_type);
        writer.endElement(); // Default
    }

    for (const auto& override_type : override_types_) {
        writer.startElement("Override");
        writer.writeAttribute("PartName", override_type.part_name);
        writer.writeAttribute("ContentType", override_type.content_type);
        writer.endElement(); // Override
    }

    writer.endElement(); // Types
    writer.endDocument();
    return writer.takeString();
}

void ContentTypes::clear() {
    default_types_.clear();
    override_types_.clear();
}

}} // namespace blobxl::xml
