#pragma once

#include "blobxl/core/Table.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace blobxl {
namespace core {

struct CSVOptions {
    char delimiter = ',';
    char quote_char = '"';
    bool skip_blank_lines = true;   // 跳过空行与仅含空白的行
    bool infer_types = true;        // 按列推断布尔/数值类型
    std::vector<std::string> na_values = defaultMissingValues();

    static std::vector<std::string> defaultMissingValues();

    CSVOptions() = default;
};

// CSV解析结果信息
struct CSVParseInfo {
    size_t records_parsed = 0;     // 含表头
    size_t rows_parsed = 0;
    size_t padded_rows = 0;        // 字段不足被补齐的行
    bool had_bom = false;
    std::vector<std::string> column_names;
};

// 一条 CSV 记录及其起始物理行号（1开始）
struct CSVRecord {
    std::vector<std::string> fields;
    size_t line = 0;
};

// 列类型推断结果
enum class ColumnKind {
    Empty,      // 全部缺失
    Boolean,
    Numeric,
    Text
};

/**
 * @brief CSV 解析器：UTF-8 文本 -> Table
 *
 * 第一条非空记录为表头；按列推断类型；缺失值记为空单元格。
 * 所有失败均以 ParseException 报告。
 */
class CSVProcessor {
public:
    CSVProcessor() = default;
    explicit CSVProcessor(CSVOptions options) : options_(std::move(options)) {}

    void setOptions(const CSVOptions& options) { options_ = options; }
    const CSVOptions& getOptions() const { return options_; }

    /**
     * @brief 解析完整 CSV 内容
     * @param content 原始字节
     * @param source_name 源对象名，仅用于错误信息
     * @throws ParseException 编码错误、未闭合引号、无表头或字段过多
     */
    Table parse(std::string_view content, const std::string& source_name = "");

    /**
     * @brief 仅做分词，不做表头与类型处理
     * @throws ParseException 未闭合引号
     */
    std::vector<CSVRecord> tokenize(std::string_view content, const std::string& source_name = "") const;

    const CSVParseInfo& lastParseInfo() const { return info_; }

private:
    CSVOptions options_;
    CSVParseInfo info_;

    bool isMissing(std::string_view value) const;
    ColumnKind inferColumn(const std::vector<CSVRecord>& records, size_t col) const;
    Cell convert(const std::string& raw, ColumnKind kind) const;
};

// CSV 工具函数

/**
 * @brief 校验 UTF-8
 * @throws ParseException 含无法解码的字节
 */
void validateUtf8(std::string_view content, const std::string& source_name = "");

/**
 * @brief 去掉开头的 UTF-8 BOM
 */
std::string_view stripBom(std::string_view content, bool* had_bom = nullptr);

/**
 * @brief 表头规范化：空名改为 "Unnamed: i"，重名追加 ".1"、".2"...
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& raw);

/**
 * @brief 解析数值：带符号整数或小数/指数，允许首尾 ASCII 空白，接受 inf/infinity
 */
std::optional<double> parseNumber(std::string_view text);

/**
 * @brief 解析布尔：True/TRUE/true/False/FALSE/false
 */
std::optional<bool> parseBoolean(std::string_view text);

}} // namespace blobxl::core
