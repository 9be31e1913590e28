#include "blobxl/xml/XMLStreamWriter.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/XMLUtils.hpp"
#include <fmt/format.h>

namespace blobxl {
namespace xml {

void XMLStreamWriter::startDocument() {
    buffer_.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        throw core::XMLException("Element name cannot be empty", "", -1, __FILE__, __LINE__);
    }

    ensureElementClosed();
    buffer_.push_back('<');
    buffer_.append(name);
    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::XMLException("No element to close", "", -1, __FILE__, __LINE__);
    }

    const std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();

    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    if (name.empty()) {
        throw core::XMLException("Element name cannot be empty", "", -1, __FILE__, __LINE__);
    }

    ensureElementClosed();
    buffer_.push_back('<');
    buffer_.append(name);
    buffer_.append("/>");
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    requireOpenTag("writeAttribute");
    if (name.empty()) {
        throw core::XMLException("Attribute name cannot be empty", "", -1, __FILE__, __LINE__);
    }
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(const std::string& name, uint32_t value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(const std::string& name, size_t value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    utils::XMLUtils::appendEscapedText(buffer_, text);
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data);
}

std::string XMLStreamWriter::takeString() {
    std::string out;
    out.swap(buffer_);
    clear();
    return out;
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    while (!element_stack_.empty()) {
        element_stack_.pop();
    }
    pending_attributes_.clear();
    in_element_ = false;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        utils::XMLUtils::appendEscapedAttribute(buffer_, attr.value);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::requireOpenTag(const char* operation) const {
    if (!in_element_) {
        throw core::XMLException(fmt::format("{}: no open start tag to attach the attribute to", operation),
                                 "", -1, __FILE__, __LINE__);
    }
}

}} // namespace blobxl::xml
