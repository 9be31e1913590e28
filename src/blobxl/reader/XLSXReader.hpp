#pragma once

#include "blobxl/archive/ZipReader.hpp"
#include "blobxl/core/ErrorCode.hpp"
#include "blobxl/core/Workbook.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace blobxl {
namespace reader {

/**
 * @brief 从内存中的 XLSX 字节读回工作簿
 *
 * 支持共享字符串、内联字符串、数字、布尔值以及单元格样式索引（0/1）。
 * 其余部件（公式、图片等）被忽略。
 */
class XLSXReader {
public:
    explicit XLSXReader(std::vector<uint8_t> data);
    ~XLSXReader();

    XLSXReader(const XLSXReader&) = delete;
    XLSXReader& operator=(const XLSXReader&) = delete;

    core::ErrorCode open();
    core::ErrorCode close();

    /**
     * @brief 按 workbook.xml 中的顺序返回工作表名
     */
    core::ErrorCode getSheetNames(std::vector<std::string>& names) const;

    /**
     * @brief 读取全部工作表
     */
    core::ErrorCode loadWorkbook(std::unique_ptr<core::Workbook>& workbook);

    /**
     * @brief 包内所有部件路径
     */
    std::vector<std::string> listParts() const { return zip_.listFiles(); }

    bool isOpen() const { return is_open_; }

    const std::string& getLastError() const { return last_error_; }

private:
    struct SheetEntry {
        std::string name;
        std::string path;
    };

    std::vector<uint8_t> data_;
    archive::ZipReader zip_;
    bool is_open_ = false;
    std::vector<SheetEntry> sheets_;
    std::vector<std::string> shared_strings_;
    std::string last_error_;

    core::ErrorCode parseWorkbookXML();
    core::ErrorCode parseSharedStringsXML();
    core::ErrorCode parseWorksheetXML(const std::string& path, core::Worksheet& worksheet);
    core::ErrorCode extractPart(const std::string& path, std::string& content);
    core::ErrorCode fail(core::ErrorCode code, const std::string& message);
};

/**
 * @brief 解析 "B12" 形式的单元格引用
 * @return 格式错误时返回 false
 */
bool parseCellReference(const std::string& ref, uint32_t& row, uint32_t& col);

}} // namespace blobxl::reader
