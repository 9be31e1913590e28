#include "blobxl/xml/Relationships.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"

namespace blobxl {
namespace xml {

std::string Relationships::addRelationship(const std::string& type, const std::string& target) {
    std::string id = "rId" + std::to_string(relationships_.size() + 1);
    relationships_.push_back({id, type, target});
    return id;
}

std::string Relationships::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/relationships");

    for (const auto& rel : relationships_) {
        writer.startElement("Relationship");
        writer.writeAttribute("Id", rel.id);
        writer.writeAttribute("Type", rel.type);
        writer.writeAttribute("Target", rel.target);
        writer.endElement(); // Relationship
    }

    writer.endElement(); // Relationships
    writer.endDocument();
    return writer.takeString();
}

}} // namespace blobxl::xml
