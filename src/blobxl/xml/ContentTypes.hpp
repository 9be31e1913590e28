#pragma once

#include <string>
#include <vector>

namespace blobxl {
namespace xml {

/**
 * @brief [Content_Types].xml
 */
class ContentTypes {
public:
    ContentTypes() = default;

    // 添加默认内容类型
    void addDefault(const std::string& extension, const std::string& content_type);

    // 添加覆盖内容类型
    void addOverride(const std::string& part_name, const std::string& content_type);

    // rels 与 xml 两个默认类型
    void addExcelDefaults();

    std::string generate() const;

    void clear();

private:
    struct DefaultType {
        std::string extension;
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;
        std::string content_type;
    };

    std::vector<DefaultType> default_types_;
    std::vector<OverrideType> override_types_;
};

}} // namespace blobxl::xml
