#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <expat.h>

namespace blobxl {
namespace xml {

/**
 * @brief 基于 libexpat 的流式 XML 解析器
 *
 * 事件回调：开始元素、结束元素、元素文本。元素文本在元素结束时一次性回调，
 * 只包含最后一个子元素之后的文本段。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }

    // 默认不去除首尾空白
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getLastErrorLine() const { return last_error_line_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    /**
     * @brief 小文档的 DOM 表示
     */
    struct SimpleElement {
        std::string name;
        std::unordered_map<std::string, std::string> attributes;
        std::string text;
        std::vector<std::unique_ptr<SimpleElement>> children;
        SimpleElement* parent = nullptr;

        explicit SimpleElement(std::string n) : name(std::move(n)) {}

        SimpleElement* findChild(const std::string& element_name) const;
        std::vector<SimpleElement*> findChildren(const std::string& element_name) const;
        // 路径查找，如 "Blobs/Blob"
        SimpleElement* findChildByPath(const std::string& path) const;

        std::string getAttribute(const std::string& attr_name, const std::string& default_value = "") const;
        bool hasAttribute(const std::string& attr_name) const { return attributes.count(attr_name) > 0; }

        // 子元素的文本；不存在时返回空串
        std::string childText(const std::string& element_name) const;
    };

    /**
     * @brief 将整个文档解析为树
     * @throws core::XMLException 文档不是格式良好的 XML
     */
    std::unique_ptr<SimpleElement> parseToDOM(const std::string& xml_content);

private:
    XML_Parser parser_ = nullptr;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int last_error_line_ = -1;

    std::vector<XMLAttribute> attributes_;
    std::string current_text_;
    bool trim_whitespace_ = false;
    size_t elements_parsed_ = 0;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    static void XMLCALL startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* user_data, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* user_data, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void handleError(XMLParseError error, const std::string& message);
};

}} // namespace blobxl::xml
