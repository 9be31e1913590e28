#pragma once

#include <string>
#include <vector>

namespace blobxl {
namespace xml {

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
};

/**
 * @brief 关系部件（_rels/.rels、xl/_rels/workbook.xml.rels）
 */
class Relationships {
public:
    Relationships() = default;

    // 添加关系，id 按添加顺序分配为 rId1, rId2, ...
    std::string addRelationship(const std::string& type, const std::string& target);

    std::string generate() const;

    void clear() { relationships_.clear(); }

    size_t size() const { return relationships_.size(); }
    const std::vector<Relationship>& relationships() const { return relationships_; }

private:
    std::vector<Relationship> relationships_;
};

}} // namespace blobxl::xml
