#pragma once

#include <string>
#include <string_view>

namespace blobxl {
namespace utils {

/**
 * @brief 文本工具类 - UTF-8 感知的字符串处理
 *
 * 所有长度均以 Unicode 码点计。
 */
class TextUtils {
public:
    /**
     * @brief 码点数量
     * @throws utf8::exception 非法 UTF-8
     */
    static size_t codePointLength(std::string_view text);

    /**
     * @brief 截取前 max_code_points 个码点
     */
    static std::string truncateCodePoints(std::string_view text, size_t max_code_points);

    /**
     * @brief 去掉文件扩展名
     *
     * 扩展名从最后一个 '.' 开始，但前导的 '.' 不算扩展名：
     * "a.b.csv" -> "a.b"，".csv" -> ".csv"，"..x" -> "..x"。
     */
    static std::string stripExtension(const std::string& filename);

    /**
     * @brief 按单词边界缩短文本到 width 个码点以内
     *
     * 空白先折叠为单个空格；按空白及连字符单词内部切分后，尽量保留完整的块；
     * 首块本身超宽时硬截断。放不下时末尾追加 placeholder（可为空）。
     *
     * @throws std::invalid_argument placeholder 比 width 还长
     */
    static std::string shorten(const std::string& text, size_t width, const std::string& placeholder = " [...]");

    /**
     * @brief 折叠空白：首尾去除，中间连续空白变为单个空格
     */
    static std::string collapseWhitespace(const std::string& text);

    /**
     * @brief ASCII 大小写不敏感比较
     */
    static bool equalsIgnoreCase(std::string_view a, std::string_view b);

    static bool endsWith(std::string_view text, std::string_view suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static bool startsWith(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }
};

}} // namespace blobxl::utils
