/**
 * @file XMLStreamWriter.hpp
 * @brief 内存缓冲的 XML 流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>
#include <cstdint>

namespace blobxl {
namespace xml {

/**
 * @brief 写入到内存字符串的 XML 流写入器
 *
 * 属性在下一次写入子节点或关闭元素时统一输出；没有子节点的元素以 "<x/>" 自闭合。
 * 误用（空名字、在元素外写属性、多余的 endElement）抛出 core::XMLException。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 文档操作
     */
    void startDocument();
    void endDocument();

    /**
     * @brief 元素操作
     */
    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    /**
     * @brief 属性操作
     */
    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, const char* value) { writeAttribute(name, std::string_view(value)); }
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, uint32_t value);
    void writeAttribute(const std::string& name, size_t value);

    /**
     * @brief 文本内容操作
     */
    void writeText(std::string_view text);
    void writeRaw(std::string_view data);

    /**
     * @brief 获取输出结果；未关闭的元素不会被自动关闭
     */
    const std::string& toString() const { return buffer_; }
    std::string takeString();

    void clear();

    size_t getBytesWritten() const { return buffer_.size(); }
    size_t getDepth() const { return element_stack_.size(); }
    bool isEmpty() const { return buffer_.empty(); }

private:
    struct PendingAttribute {
        std::string key;
        std::string value;

        PendingAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };

    std::string buffer_;
    std::stack<std::string> element_stack_;
    std::vector<PendingAttribute> pending_attributes_;
    bool in_element_ = false;

    void ensureElementClosed();
    void writeAttributesToBuffer();
    void requireOpenTag(const char* operation) const;
};

}} // namespace blobxl::xml
