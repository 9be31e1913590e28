#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace blobxl {
namespace utils {

/**
 * @brief XML工具类 - 提供XML相关的辅助函数
 */
class XMLUtils {
public:
    /**
     * @brief 元素文本转义：& < >
     *
     * XML 1.0 不允许的控制字符被丢弃（保留制表符、换行符、回车符）。
     */
    static void appendEscapedText(std::string& out, std::string_view text) {
        for (char c : text) {
            switch (c) {
            case '&': out.append("&amp;"); break;
            case '<': out.append("&lt;"); break;
            case '>': out.append("&gt;"); break;
            default:
                if (isDroppedControl(c)) {
                    continue;
                }
                out.push_back(c);
                break;
            }
        }
    }

    /**
     * @brief 属性值转义：& < > " 以及换行
     */
    static void appendEscapedAttribute(std::string& out, std::string_view value) {
        for (char c : value) {
            switch (c) {
            case '&': out.append("&amp;"); break;
            case '<': out.append("&lt;"); break;
            case '>': out.append("&gt;"); break;
            case '"': out.append("&quot;"); break;
            case '\n': out.append("&#xA;"); break;
            default:
                if (isDroppedControl(c)) {
                    continue;
                }
                out.push_back(c);
                break;
            }
        }
    }

    static std::string escapeText(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        appendEscapedText(out, text);
        return out;
    }

    static std::string escapeAttribute(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        appendEscapedAttribute(out, value);
        return out;
    }

    /**
     * @brief Excel 字符串转义：控制字符写成 _xHHHH_，字面量 _xHHHH_ 前加 _x005F
     *
     * 例："\x01" -> "_x0001_"，"_x0000_" -> "_x005F_x0000_"
     */
    static std::string escapeExcelControls(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            const unsigned char uc = static_cast<unsigned char>(text[i]);
            if (uc == '_' && isEscapeSequenceAt(text, i)) {
                out.append("_x005F");
                out.push_back('_');
            } else if (uc < 0x20 && uc != '\t' && uc != '\n') {
                out.append(fmt::format("_x{:04X}_", static_cast<unsigned>(uc)));
            } else {
                out.push_back(static_cast<char>(uc));
            }
        }
        return out;
    }

    /**
     * @brief escapeExcelControls 的逆操作
     */
    static std::string unescapeExcelControls(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            if (text[i] == '_' && isEscapeSequenceAt(text, i)) {
                const unsigned value = static_cast<unsigned>(std::stoul(std::string(text.substr(i + 2, 4)), nullptr, 16));
                if (value == 0x5F && isEscapeSequenceAt(text, i + 6)) {
                    // _x005F 后跟的转义序列按字面量保留
                    out.append(text.substr(i + 6, 7));
                    i += 13;
                    continue;
                }
                if (value < 0x80) {
                    out.push_back(static_cast<char>(value));
                    i += 7;
                    continue;
                }
            }
            out.push_back(text[i]);
            ++i;
        }
        return out;
    }

private:
    static bool isDroppedControl(char c) {
        const unsigned char uc = static_cast<unsigned char>(c);
        return uc < 0x20 && uc != 0x09 && uc != 0x0A && uc != 0x0D;
    }

    static bool isHex(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    // text[pos..pos+7) 是否形如 _xHHHH_
    static bool isEscapeSequenceAt(std::string_view text, size_t pos) {
        if (pos + 7 > text.size() || text[pos] != '_' || text[pos + 1] != 'x' || text[pos + 6] != '_') {
            return false;
        }
        return isHex(text[pos + 2]) && isHex(text[pos + 3]) && isHex(text[pos + 4]) && isHex(text[pos + 5]);
    }
};

}} // namespace blobxl::utils
