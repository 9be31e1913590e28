#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace blobxl {
namespace xml {

/**
 * @brief 共享字符串表（xl/sharedStrings.xml）
 */
class SharedStrings {
public:
    SharedStrings() = default;

    // 添加共享字符串，返回索引；重复字符串复用已有索引
    uint32_t addString(const std::string& str);

    // 不存在时返回 -1
    int64_t getStringIndex(const std::string& str) const;

    const std::string& getString(uint32_t index) const { return strings_.at(index); }

    // 生成 sharedStrings.xml
    std::string generate() const;

    void clear();

    size_t size() const { return strings_.size(); }
    size_t referenceCount() const { return reference_count_; }

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, uint32_t> string_map_;
    size_t reference_count_ = 0;
};

}} // namespace blobxl::xml
