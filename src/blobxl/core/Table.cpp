#include "blobxl/core/Table.hpp"
#include "blobxl/core/Exception.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace blobxl {
namespace core {

Table::Table(std::vector<std::string> columns, std::vector<Row> rows)
    : columns_(std::move(columns)), rows_(std::move(rows)) {
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].size() != columns_.size()) {
            throw BlobxlException(
                fmt::format("Row {} has {} cells, expected {}", i, rows_[i].size(), columns_.size()),
                ErrorCode::InvalidArgument, __FILE__, __LINE__);
        }
    }
}

bool TableSet::insertOrAssign(const std::string& key, Table table) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(table);
        return false;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(table));
    return true;
}

bool TableSet::contains(const std::string& key) const {
    return index_.find(key) != index_.end();
}

const Table& TableSet::at(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw std::out_of_range("TableSet has no entry named " + key);
    }
    return entries_[it->second].second;
}

std::vector<std::string> TableSet::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

}} // namespace blobxl::core
