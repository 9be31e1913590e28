#include "blobxl/core/Workbook.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"
#include <fmt/format.h>
#include <utf8.h>

namespace blobxl {
namespace core {

std::shared_ptr<Worksheet> Workbook::addSheet(const std::string& name) {
    for (const auto& sheet : worksheets_) {
        if (!name.empty() && sheet->getName() == name) {
            CORE_DEBUG("Sheet '{}' already exists, reusing it", name);
            return sheet;
        }
    }

    // 只统计新建工作表的请求
    ++sheetname_count_;
    const std::string sheet_name = name.empty() ? fmt::format("Sheet{}", sheetname_count_) : name;

    validateSheetName(sheet_name);

    for (const auto& sheet : worksheets_) {
        if (utils::TextUtils::equalsIgnoreCase(sheet->getName(), sheet_name)) {
            throw SerializationException(
                fmt::format("Sheetname '{}', with case ignored, is already in use.", sheet_name),
                sheet_name, ErrorCode::InvalidWorksheet, __FILE__, __LINE__);
        }
    }

    auto worksheet = std::make_shared<Worksheet>(sheet_name, static_cast<uint32_t>(worksheets_.size() + 1));
    worksheets_.push_back(worksheet);
    CORE_DEBUG("Added sheet '{}' (id {})", sheet_name, worksheet->getSheetId());
    return worksheet;
}

void Workbook::validateSheetName(const std::string& name) const {
    size_t length = 0;
    try {
        length = utils::TextUtils::codePointLength(name);
    } catch (const utf8::exception&) {
        throw SerializationException(fmt::format("Sheetname '{}' is not valid UTF-8.", name),
                                     name, ErrorCode::InvalidWorksheet, __FILE__, __LINE__);
    }

    if (length > kMaxSheetNameLength) {
        throw SerializationException(
            fmt::format("Excel worksheet name '{}' must be <= {} chars.", name, kMaxSheetNameLength),
            name, ErrorCode::InvalidWorksheet, __FILE__, __LINE__);
    }

    if (name.find_first_of("[]:*?/\\") != std::string::npos) {
        throw SerializationException(
            fmt::format("Invalid Excel character '[]:*?/\\' in sheetname '{}'.", name),
            name, ErrorCode::InvalidWorksheet, __FILE__, __LINE__);
    }

    if (name.front() == '\'' || name.back() == '\'') {
        throw SerializationException(
            fmt::format("Sheet name cannot start or end with an apostrophe \"{}\".", name),
            name, ErrorCode::InvalidWorksheet, __FILE__, __LINE__);
    }
}

std::shared_ptr<Worksheet> Workbook::getSheet(const std::string& name) {
    for (const auto& sheet : worksheets_) {
        if (sheet->getName() == name) {
            return sheet;
        }
    }
    return nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(const std::string& name) const {
    for (const auto& sheet : worksheets_) {
        if (sheet->getName() == name) {
            return sheet;
        }
    }
    return nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(size_t index) const {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(worksheets_.size());
    for (const auto& sheet : worksheets_) {
        names.push_back(sheet->getName());
    }
    return names;
}

}} // namespace blobxl::core
