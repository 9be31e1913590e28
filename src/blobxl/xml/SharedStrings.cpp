#include "blobxl/xml/SharedStrings.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"
#include "blobxl/utils/XMLUtils.hpp"

namespace blobxl {
namespace xml {

namespace {

bool needsPreserve(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    return is_space(str.front()) || is_space(str.back());
}

} // namespace

uint32_t SharedStrings::addString(const std::string& str) {
    ++reference_count_;
    auto it = string_map_.find(str);
    if (it != string_map_.end()) {
        return it->second;
    }
    const auto index = static_cast<uint32_t>(strings_.size());
    strings_.push_back(str);
    string_map_.emplace(str, index);
    return index;
}

int64_t SharedStrings::getStringIndex(const std::string& str) const {
    auto it = string_map_.find(str);
    return it == string_map_.end() ? -1 : static_cast<int64_t>(it->second);
}

std::string SharedStrings::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("sst");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("count", reference_count_);
    writer.writeAttribute("uniqueCount", strings_.size());

    for (const auto& str : strings_) {
        writer.startElement("si");
        writer.startElement("t");
        if (needsPreserve(str)) {
            writer.writeAttribute("xml:space", "preserve");
        }
        writer.writeText(utils::XMLUtils::escapeExcelControls(str));
        writer.endElement(); // t
        writer.endElement(); // si
    }

    writer.endElement(); // sst
    writer.endDocument();
    return writer.takeString();
}

void SharedStrings::clear() {
    strings_.clear();
    string_map_.clear();
    reference_count_ = 0;
}

}} // namespace blobxl::xml
