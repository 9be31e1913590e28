#pragma once

#include "blobxl/core/Worksheet.hpp"
#include <memory>
#include <string>
#include <vector>

namespace blobxl {
namespace core {

/**
 * @brief 文档属性（docProps/core.xml 与 app.xml）
 */
struct DocumentProperties {
    std::string title;
    std::string author = "blobxl";
    std::string application = "blobxl";
};

/**
 * @brief 内存中的工作簿
 *
 * 工作表名规则：
 * - 空名字分配为 "Sheet<N>"，N 为新建工作表的请求次数（复用已有工作表不计）
 * - 名字不得含 []:*?/\ ，不得以单引号开头或结尾，不得超过 31 个字符
 * - 与已有工作表完全同名时返回已有工作表，后续写入按单元格覆盖
 * - 仅大小写不同视为重复，抛出 SerializationException
 */
class Workbook {
public:
    static constexpr size_t kMaxSheetNameLength = 31;

    Workbook() = default;

    /**
     * @brief 添加或取回工作表
     * @throws SerializationException 名字非法或大小写冲突（InvalidWorksheet）
     */
    std::shared_ptr<Worksheet> addSheet(const std::string& name = "");

    std::shared_ptr<Worksheet> getSheet(const std::string& name);
    std::shared_ptr<const Worksheet> getSheet(const std::string& name) const;
    std::shared_ptr<const Worksheet> getSheet(size_t index) const;

    size_t getSheetCount() const { return worksheets_.size(); }
    std::vector<std::string> getSheetNames() const;

    const std::vector<std::shared_ptr<Worksheet>>& worksheets() const { return worksheets_; }

    DocumentProperties& properties() { return properties_; }
    const DocumentProperties& properties() const { return properties_; }

private:
    void validateSheetName(const std::string& name) const;

    std::vector<std::shared_ptr<Worksheet>> worksheets_;
    DocumentProperties properties_;
    size_t sheetname_count_ = 0;
};

}} // namespace blobxl::core
