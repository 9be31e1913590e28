#pragma once

#include "blobxl/core/Cell.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <utility>

namespace blobxl {
namespace core {

/**
 * @brief 一张由 CSV 解析出的表：表头 + 定长数据行
 *
 * 构造后不可修改；每行的单元格数与列数相同。
 */
class Table {
public:
    using Row = std::vector<Cell>;

    Table() = default;

    /**
     * @brief 构造表
     * @throws BlobxlException 行宽与列数不一致（InvalidArgument）
     */
    Table(std::vector<std::string> columns, std::vector<Row> rows);

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<Row>& rows() const { return rows_; }

    size_t columnCount() const { return columns_.size(); }
    size_t rowCount() const { return rows_.size(); }

    const Cell& at(size_t row, size_t col) const { return rows_.at(row).at(col); }

private:
    std::vector<std::string> columns_;
    std::vector<Row> rows_;
};

/**
 * @brief 源对象名 -> Table 的有序映射
 *
 * 迭代顺序为键的首次插入顺序；对已有键再次插入会替换其值并保留位置。
 */
class TableSet {
public:
    using Entry = std::pair<std::string, Table>;
    using const_iterator = std::vector<Entry>::const_iterator;

    /**
     * @brief 插入或替换
     * @return 新插入返回 true，替换已有键返回 false
     */
    bool insertOrAssign(const std::string& key, Table table);

    bool contains(const std::string& key) const;

    /**
     * @throws std::out_of_range 键不存在
     */
    const Table& at(const std::string& key) const;

    std::vector<std::string> keys() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

}} // namespace blobxl::core
