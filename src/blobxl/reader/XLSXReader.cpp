#include "blobxl/reader/XLSXReader.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/xml/XMLStreamReader.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/XMLUtils.hpp"
#include <fast_float/fast_float.h>
#include <fmt/format.h>
#include <unordered_map>

namespace blobxl {
namespace reader {

namespace {

std::string attributeValue(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
    for (const auto& attr : attributes) {
        if (attr.name == name) {
            return std::string(attr.value);
        }
    }
    return {};
}

// 去掉命名空间前缀，如 "x:c" -> "c"
std::string_view localName(std::string_view name) {
    const size_t colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

} // namespace

bool parseCellReference(const std::string& ref, uint32_t& row, uint32_t& col) {
    size_t i = 0;
    uint64_t column = 0;
    while (i < ref.size() && ref[i] >= 'A' && ref[i] <= 'Z') {
        column = column * 26 + static_cast<uint64_t>(ref[i] - 'A' + 1);
        if (column > core::Worksheet::kMaxColumns) {
            return false;
        }
        ++i;
    }
    if (i == 0 || i == ref.size()) {
        return false;
    }
    uint64_t row_number = 0;
    for (; i < ref.size(); ++i) {
        if (ref[i] < '0' || ref[i] > '9') {
            return false;
        }
        row_number = row_number * 10 + static_cast<uint64_t>(ref[i] - '0');
        if (row_number > core::Worksheet::kMaxRows) {
            return false;
        }
    }
    if (row_number == 0) {
        return false;
    }
    row = static_cast<uint32_t>(row_number - 1);
    col = static_cast<uint32_t>(column - 1);
    return true;
}

XLSXReader::XLSXReader(std::vector<uint8_t> data)
    : data_(std::move(data)) {
}

XLSXReader::~XLSXReader() {
    close();
}

core::ErrorCode XLSXReader::fail(core::ErrorCode code, const std::string& message) {
    last_error_ = message;
    READER_ERROR("{}", message);
    return code;
}

core::ErrorCode XLSXReader::open() {
    if (is_open_) {
        return core::ErrorCode::Ok;
    }
    if (!zip_.open(data_)) {
        return fail(core::ErrorCode::ZipError, "Data is not a readable ZIP archive");
    }
    is_open_ = true;

    core::ErrorCode result = parseWorkbookXML();
    if (result != core::ErrorCode::Ok) {
        close();
        return result;
    }
    result = parseSharedStringsXML();
    if (result != core::ErrorCode::Ok) {
        close();
        return result;
    }

    READER_DEBUG("Opened workbook with {} sheets and {} shared strings", sheets_.size(), shared_strings_.size());
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::close() {
    zip_.close();
    is_open_ = false;
    sheets_.clear();
    shared_strings_.clear();
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::getSheetNames(std::vector<std::string>& names) const {
    if (!is_open_) {
        return core::ErrorCode::InvalidArgument;
    }
    names.clear();
    for (const auto& sheet : sheets_) {
        names.push_back(sheet.name);
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::loadWorkbook(std::unique_ptr<core::Workbook>& workbook) {
    if (!is_open_) {
        core::ErrorCode result = open();
        if (result != core::ErrorCode::Ok) {
            return result;
        }
    }

    auto loaded = std::make_unique<core::Workbook>();
    for (const auto& entry : sheets_) {
        std::shared_ptr<core::Worksheet> sheet;
        try {
            sheet = loaded->addSheet(entry.name);
        } catch (const core::SerializationException& e) {
            return fail(core::ErrorCode::XmlInvalidFormat, e.what());
        }
        core::ErrorCode result = parseWorksheetXML(entry.path, *sheet);
        if (result != core::ErrorCode::Ok) {
            return result;
        }
    }
    workbook = std::move(loaded);
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::extractPart(const std::string& path, std::string& content) {
    const archive::ZipError result = zip_.extractFile(path, content);
    if (archive::isError(result)) {
        return fail(result == archive::ZipError::FileNotFound ? core::ErrorCode::XmlInvalidFormat
                                                              : core::ErrorCode::ZipError,
                    fmt::format("Cannot read part {}: {}", path, archive::toString(result)));
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseWorkbookXML() {
    std::string rels_xml;
    core::ErrorCode result = extractPart("xl/_rels/workbook.xml.rels", rels_xml);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    std::unordered_map<std::string, std::string> targets;
    xml::XMLStreamReader rels_reader;
    rels_reader.setStartElementCallback([&](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int) {
        if (localName(name) == "Relationship") {
            targets[attributeValue(attributes, "Id")] = attributeValue(attributes, "Target");
        }
    });
    if (xml::isError(rels_reader.parseFromString(rels_xml))) {
        return fail(core::ErrorCode::XmlParseError, "Invalid workbook relationships: " + rels_reader.getLastErrorMessage());
    }

    std::string workbook_xml;
    result = extractPart("xl/workbook.xml", workbook_xml);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    sheets_.clear();
    xml::XMLStreamReader workbook_reader;
    workbook_reader.setStartElementCallback([&](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int) {
        if (localName(name) != "sheet") {
            return;
        }
        SheetEntry entry;
        entry.name = attributeValue(attributes, "name");
        const auto target = targets.find(attributeValue(attributes, "r:id"));
        if (target != targets.end()) {
            const std::string& t = target->second;
            entry.path = !t.empty() && t.front() == '/' ? t.substr(1) : "xl/" + t;
        }
        sheets_.push_back(std::move(entry));
    });
    if (xml::isError(workbook_reader.parseFromString(workbook_xml))) {
        return fail(core::ErrorCode::XmlParseError, "Invalid workbook.xml: " + workbook_reader.getLastErrorMessage());
    }

    for (const auto& sheet : sheets_) {
        if (sheet.path.empty()) {
            return fail(core::ErrorCode::XmlInvalidFormat, fmt::format("Sheet '{}' has no relationship target", sheet.name));
        }
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseSharedStringsXML() {
    shared_strings_.clear();
    if (archive::isError(zip_.fileExists("xl/sharedStrings.xml"))) {
        return core::ErrorCode::Ok;
    }

    std::string content;
    core::ErrorCode result = extractPart("xl/sharedStrings.xml", content);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    std::string current;
    std::vector<std::string> open_elements;
    xml::XMLStreamReader reader;
    reader.setStartElementCallback([&](std::string_view name, const std::vector<xml::XMLAttribute>&, int) {
        open_elements.emplace_back(localName(name));
        if (open_elements.back() == "si") {
            current.clear();
        }
    });
    // 富文本 <r><t> 拼接；注音 <rPh> 中的文本不计入
    reader.setTextCallback([&](std::string_view text, int) {
        if (open_elements.empty() || open_elements.back() != "t") {
            return;
        }
        for (const auto& element : open_elements) {
            if (element == "rPh") {
                return;
            }
        }
        current.append(text.data(), text.size());
    });
    reader.setEndElementCallback([&](std::string_view name, int) {
        if (localName(name) == "si") {
            shared_strings_.push_back(utils::XMLUtils::unescapeExcelControls(current));
        }
        if (!open_elements.empty()) {
            open_elements.pop_back();
        }
    });
    if (xml::isError(reader.parseFromString(content))) {
        return fail(core::ErrorCode::XmlParseError, "Invalid sharedStrings.xml: " + reader.getLastErrorMessage());
    }
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseWorksheetXML(const std::string& path, core::Worksheet& worksheet) {
    std::string content;
    core::ErrorCode result = extractPart(path, content);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    struct PendingCell {
        std::string ref;
        std::string type;
        int style = 0;
        std::string value;
        bool has_value = false;
    } pending;
    std::string current_element;

    xml::XMLStreamReader reader;
    reader.setStartElementCallback([&](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int) {
        current_element.assign(localName(name));
        if (current_element == "c") {
            pending = PendingCell{};
            pending.ref = attributeValue(attributes, "r");
            pending.type = attributeValue(attributes, "t");
            const std::string style = attributeValue(attributes, "s");
            pending.style = style == "1" ? 1 : 0;
        }
    });
    // 文本在元素结束时回调，此时 current_element 仍是最内层的叶子元素
    reader.setTextCallback([&](std::string_view text, int) {
        if (current_element == "v" || current_element == "t") {
            pending.value.append(text.data(), text.size());
            pending.has_value = true;
        }
    });
    reader.setEndElementCallback([&](std::string_view name, int) {
        current_element.clear();
        if (localName(name) != "c") {
            return;
        }
        uint32_t row = 0;
        uint32_t col = 0;
        if (!parseCellReference(pending.ref, row, col)) {
            throw core::XMLException(fmt::format("Invalid cell reference '{}'", pending.ref), path, -1, __FILE__, __LINE__);
        }
        const auto style = static_cast<core::CellStyle>(pending.style);

        if (!pending.has_value) {
            if (style != core::CellStyle::Default) {
                worksheet.writeBlank(row, col, style);
            }
            return;
        }

        core::Cell cell;
        if (pending.type == "s") {
            const unsigned long index = std::stoul(pending.value);
            if (index >= shared_strings_.size()) {
                throw core::XMLException(fmt::format("Shared string index {} out of range", index), path, -1, __FILE__, __LINE__);
            }
            cell = core::Cell::string(shared_strings_[index]);
        } else if (pending.type == "b") {
            cell = core::Cell::boolean(pending.value == "1");
        } else if (pending.type == "inlineStr" || pending.type == "str") {
            cell = core::Cell::string(utils::XMLUtils::unescapeExcelControls(pending.value));
        } else {
            double number = 0.0;
            const char* first = pending.value.data();
            const char* last = first + pending.value.size();
            auto parsed = fast_float::from_chars(first, last, number);
            if (parsed.ec != std::errc() || parsed.ptr != last) {
                throw core::XMLException(fmt::format("Invalid numeric value '{}' in {}", pending.value, pending.ref),
                                         path, -1, __FILE__, __LINE__);
            }
            cell = core::Cell::number(number);
        }
        worksheet.writeCell(row, col, cell, style);
    });

    if (xml::isError(reader.parseFromString(content))) {
        return fail(core::ErrorCode::XmlParseError, fmt::format("Invalid worksheet {}: {}", path, reader.getLastErrorMessage()));
    }
    return core::ErrorCode::Ok;
}

}} // namespace blobxl::reader
