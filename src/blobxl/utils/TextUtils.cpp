#include "blobxl/utils/TextUtils.hpp"
#include <utf8.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace blobxl {
namespace utils {

namespace {

bool isSpace(char32_t c) {
    switch (c) {
        case U' ': case U'\t': case U'\n': case U'\v': case U'\f': case U'\r':
        case 0x1C: case 0x1D: case 0x1E: case 0x1F: case 0x85: case 0xA0:
        case 0x1680: case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

struct CodePointRange {
    char32_t first;
    char32_t last;
};

// 标点与符号区块（非单词字符）
constexpr CodePointRange kNonWordRanges[] = {
    {0x0080, 0x00A9}, {0x00AB, 0x00B1}, {0x00B4, 0x00B4}, {0x00B6, 0x00B8}, {0x00BB, 0x00BB},
    {0x00BF, 0x00BF}, {0x00D7, 0x00D7}, {0x00F7, 0x00F7},
    {0x2010, 0x2027}, {0x2030, 0x205E}, {0x20A0, 0x20CF}, {0x2190, 0x245F}, {0x2500, 0x2775},
    {0x2794, 0x2BFF}, {0x2E00, 0x2E7F},
    {0x3001, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030}, {0x303D, 0x303F},
    {0xE000, 0xF8FF}, {0xFE10, 0xFE19}, {0xFE30, 0xFE6F},
    {0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65}, {0xFFE0, 0xFFEE},
    {0x1F000, 0x1FAFF}
};

// 十进制数字（Nd）
constexpr CodePointRange kDigitRanges[] = {
    {0x0030, 0x0039}, {0x0660, 0x0669}, {0x06F0, 0x06F9}, {0x07C0, 0x07C9}, {0x0966, 0x096F},
    {0x09E6, 0x09EF}, {0x0A66, 0x0A6F}, {0x0AE6, 0x0AEF}, {0x0B66, 0x0B6F}, {0x0BE6, 0x0BEF},
    {0x0C66, 0x0C6F}, {0x0CE6, 0x0CEF}, {0x0D66, 0x0D6F}, {0x0E50, 0x0E59}, {0x0ED0, 0x0ED9},
    {0x0F20, 0x0F29}, {0x1040, 0x1049}, {0x17E0, 0x17E9}, {0x1810, 0x1819}, {0xFF10, 0xFF19},
    {0x1D7CE, 0x1D7FF}
};

template<size_t N>
bool inRanges(char32_t c, const CodePointRange (&ranges)[N]) {
    for (const auto& range : ranges) {
        if (c < range.first) return false;
        if (c <= range.last) return true;
    }
    return false;
}

bool isDigit(char32_t c) {
    return inRanges(c, kDigitRanges);
}

// 单词字符：字母、数字、下划线
bool isWordChar(char32_t c) {
    if (c < 0x80) {
        return (c >= U'0' && c <= U'9') || c == U'_' || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
    }
    return !isSpace(c) && !inRanges(c, kNonWordRanges);
}

bool isLetter(char32_t c) {
    return isWordChar(c) && !isDigit(c);
}

bool isWordPunct(char32_t c) {
    return isWordChar(c) || c == U'!' || c == U'"' || c == U'\'' || c == U'&' ||
           c == U'.' || c == U',' || c == U'?';
}

std::u32string toU32(const std::string& text) {
    std::u32string out;
    utf8::utf8to32(text.begin(), text.end(), std::back_inserter(out));
    return out;
}

std::string toU8(const std::u32string& text) {
    std::string out;
    utf8::utf32to8(text.begin(), text.end(), std::back_inserter(out));
    return out;
}

// 单个单词在连字符处的切分点（切在连字符之后）
bool isHyphenBreak(const std::u32string& w, size_t i) {
    if (w[i] != U'-') return false;
    const bool behind = (i >= 2 && isLetter(w[i - 1]) && isLetter(w[i - 2])) ||
                        (i >= 3 && isLetter(w[i - 1]) && w[i - 2] == U'-' && isLetter(w[i - 3]));
    if (!behind) return false;
    if (i + 2 >= w.size() || !isLetter(w[i + 1])) return false;
    if (isLetter(w[i + 2])) return true;
    return w[i + 2] == U'-' && i + 3 < w.size() && isLetter(w[i + 3]);
}

void splitWord(const std::u32string& w, std::vector<std::u32string>& chunks) {
    size_t start = 0;
    size_t i = 1;  // 每块至少一个字符
    while (i < w.size()) {
        if (w[i] == U'-' && i + 1 < w.size() && w[i + 1] == U'-') {
            size_t run_end = i;
            while (run_end < w.size() && w[run_end] == U'-') ++run_end;
            if (isWordPunct(w[i - 1]) && run_end < w.size() && isWordChar(w[run_end])) {
                // 破折号独立成块
                chunks.push_back(w.substr(start, i - start));
                chunks.push_back(w.substr(i, run_end - i));
                start = run_end;
                i = run_end + 1;
                continue;
            }
            i = run_end;
            continue;
        }
        if (isHyphenBreak(w, i)) {
            chunks.push_back(w.substr(start, i + 1 - start));
            start = i + 1;
            i = start + 1;
            continue;
        }
        ++i;
    }
    if (start < w.size()) {
        chunks.push_back(w.substr(start));
    }
}

std::vector<std::u32string> splitChunks(const std::u32string& text) {
    std::vector<std::u32string> chunks;
    size_t i = 0;
    while (i < text.size()) {
        size_t j = i;
        if (isSpace(text[i])) {
            while (j < text.size() && isSpace(text[j])) ++j;
            chunks.push_back(text.substr(i, j - i));
        } else {
            while (j < text.size() && !isSpace(text[j])) ++j;
            splitWord(text.substr(i, j - i), chunks);
        }
        i = j;
    }
    return chunks;
}

bool isBlank(const std::u32string& chunk) {
    for (char32_t c : chunk) {
        if (!isSpace(c)) return false;
    }
    return true;
}

} // namespace

size_t TextUtils::codePointLength(std::string_view text) {
    return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string TextUtils::truncateCodePoints(std::string_view text, size_t max_code_points) {
    auto it = text.begin();
    size_t count = 0;
    while (it != text.end() && count < max_code_points) {
        utf8::next(it, text.end());
        ++count;
    }
    return std::string(text.begin(), it);
}

std::string TextUtils::stripExtension(const std::string& filename) {
    const size_t sep = filename.find_last_of('/');
    const size_t dot = filename.find_last_of('.');
    const size_t name_start = (sep == std::string::npos) ? 0 : sep + 1;
    if (dot == std::string::npos || dot < name_start) {
        return filename;
    }
    for (size_t i = name_start; i < dot; ++i) {
        if (filename[i] != '.') {
            return filename.substr(0, dot);
        }
    }
    return filename;
}

std::string TextUtils::collapseWhitespace(const std::string& text) {
    const std::u32string u = toU32(text);
    std::u32string out;
    out.reserve(u.size());
    bool pending_space = false;
    for (char32_t c : u) {
        if (isSpace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(U' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return toU8(out);
}

std::string TextUtils::shorten(const std::string& text, size_t width, const std::string& placeholder) {
    const std::u32string ph = toU32(placeholder);
    std::u32string ph_stripped = ph;
    while (!ph_stripped.empty() && isSpace(ph_stripped.front())) ph_stripped.erase(0, 1);
    if (ph_stripped.size() > width) {
        throw std::invalid_argument("placeholder too large for max width");
    }

    const std::u32string collapsed = toU32(collapseWhitespace(text));
    if (collapsed.size() <= width) {
        return toU8(collapsed);
    }

    // 逆序存放，back() 为下一块
    std::vector<std::u32string> chunks = splitChunks(collapsed);
    std::reverse(chunks.begin(), chunks.end());

    std::vector<std::u32string> cur_line;
    size_t cur_len = 0;

    while (!chunks.empty()) {
        const size_t len = chunks.back().size();
        if (cur_len + len <= width) {
            cur_len += len;
            cur_line.push_back(std::move(chunks.back()));
            chunks.pop_back();
        } else {
            break;
        }
    }

    // 超长单词：用剩余空间硬截断，可能的话截在连字符之后
    if (!chunks.empty() && chunks.back().size() > width) {
        const size_t space_left = width > cur_len ? width - cur_len : (width < 1 ? 1 : 0);
        std::u32string& chunk = chunks.back();
        size_t end = space_left;
        if (chunk.size() > space_left && space_left > 0) {
            const size_t hyphen = chunk.rfind(U'-', space_left - 1);
            if (hyphen != std::u32string::npos && hyphen > 0) {
                bool has_non_hyphen = false;
                for (size_t k = 0; k < hyphen; ++k) {
                    if (chunk[k] != U'-') { has_non_hyphen = true; break; }
                }
                if (has_non_hyphen) end = hyphen + 1;
            }
        }
        if (end > 0) {
            cur_line.push_back(chunk.substr(0, end));
            chunk.erase(0, end);
        }
        cur_len = 0;
        for (const auto& c : cur_line) cur_len += c.size();
    }

    if (!cur_line.empty() && isBlank(cur_line.back())) {
        cur_len -= cur_line.back().size();
        cur_line.pop_back();
    }

    const bool rest_is_blank = chunks.empty() || (chunks.size() == 1 && isBlank(chunks.front()));
    std::u32string result;
    if (!cur_line.empty() && rest_is_blank && cur_len <= width) {
        for (const auto& c : cur_line) result += c;
        return toU8(result);
    }

    while (!cur_line.empty()) {
        if (!isBlank(cur_line.back()) && cur_len + ph.size() <= width) {
            for (const auto& c : cur_line) result += c;
            result += ph;
            return toU8(result);
        }
        cur_len -= cur_line.back().size();
        cur_line.pop_back();
    }
    return toU8(ph_stripped);
}

bool TextUtils::equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

}} // namespace blobxl::utils
