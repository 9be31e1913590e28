#pragma once

#include "blobxl/core/Workbook.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace blobxl {
namespace core {

/**
 * @brief 把 Workbook 序列化为 XLSX 字节
 *
 * 部件写入顺序：
 * [Content_Types].xml, _rels/.rels, docProps/app.xml, docProps/core.xml,
 * xl/workbook.xml, xl/_rels/workbook.xml.rels, xl/styles.xml,
 * xl/sharedStrings.xml, xl/worksheets/sheetN.xml
 */
class ExcelStructureGenerator {
public:
    explicit ExcelStructureGenerator(int compression_level = 6);

    /**
     * @brief 生成完整的 XLSX 包
     * @throws SerializationException 工作簿为空或 ZIP 构建失败
     */
    std::vector<uint8_t> generate(const Workbook& workbook) const;

    // 固定创建时间，便于测试得到确定的输出；0 表示使用当前时间
    void setCreatedTime(std::time_t created) { created_time_ = created; }

private:
    int compression_level_;
    std::time_t created_time_ = 0;

    static std::string generateWorkbookXML(const Workbook& workbook);
    static std::string generateContentTypesXML(const Workbook& workbook);
    static std::string generateRootRelsXML();
    static std::string generateWorkbookRelsXML(const Workbook& workbook);
    static std::string worksheetPath(size_t index);
};

}} // namespace blobxl::core
