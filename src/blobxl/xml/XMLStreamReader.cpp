#include "blobxl/xml/XMLStreamReader.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <climits>
#include <cstring>

namespace blobxl {
namespace xml {

XMLStreamReader::XMLStreamReader() = default;

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();
    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }
    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    last_error_line_ = -1;
    attributes_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();
    if (!buffer || size == 0 || size > INT_MAX) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return last_error_;
    }
    if (!initializeParser()) {
        return last_error_;
    }

    if (XML_Parse(parser_, buffer, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调中止解析时保留回调的错误
        if (last_error_ == XMLParseError::Ok) {
            last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
            handleError(XMLParseError::ParseFailed,
                        fmt::format("Parse error at line {}, column {}: {}",
                                    XML_GetCurrentLineNumber(parser_),
                                    XML_GetCurrentColumnNumber(parser_),
                                    XML_ErrorString(XML_GetErrorCode(parser_))));
        }
        cleanupParser();
        return last_error_;
    }

    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return last_error_;
}

void XMLCALL XMLStreamReader::startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
            reader->attributes_.emplace_back(std::string_view(attrs[i]), std::string_view(attrs[i + 1]));
        }
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(std::string_view(name, std::strlen(name)), reader->attributes_,
                                            reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleError(XMLParseError::CallbackError, "Start element callback error: " + std::string(e.what()));
            XML_StopParser(reader->parser_, XML_FALSE);
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* user_data, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    reader->current_depth_--;

    std::string_view text{reader->current_text_};
    if (reader->trim_whitespace_) {
        const size_t first = text.find_first_not_of(" \t\r\n");
        text = first == std::string_view::npos
            ? std::string_view{}
            : text.substr(first, text.find_last_not_of(" \t\r\n") - first + 1);
    }

    try {
        if (!text.empty() && reader->text_callback_) {
            reader->text_callback_(text, reader->current_depth_);
        }
        if (reader->end_element_callback_) {
            reader->end_element_callback_(std::string_view(name, std::strlen(name)), reader->current_depth_);
        }
    } catch (const std::exception& e) {
        reader->handleError(XMLParseError::CallbackError, "End element callback error: " + std::string(e.what()));
        XML_StopParser(reader->parser_, XML_FALSE);
    }

    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::characterDataHandler(void* user_data, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML parsing error: {}", message);
}

// SimpleElement

XMLStreamReader::SimpleElement* XMLStreamReader::SimpleElement::findChild(const std::string& element_name) const {
    for (const auto& child : children) {
        if (child->name == element_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<XMLStreamReader::SimpleElement*> XMLStreamReader::SimpleElement::findChildren(const std::string& element_name) const {
    std::vector<SimpleElement*> result;
    for (const auto& child : children) {
        if (child->name == element_name) {
            result.push_back(child.get());
        }
    }
    return result;
}

XMLStreamReader::SimpleElement* XMLStreamReader::SimpleElement::findChildByPath(const std::string& path) const {
    const SimpleElement* current = this;
    size_t start = 0;
    while (current && start <= path.size()) {
        size_t slash = path.find('/', start);
        const std::string part = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        current = current->findChild(part);
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return const_cast<SimpleElement*>(current);
}

std::string XMLStreamReader::SimpleElement::getAttribute(const std::string& attr_name, const std::string& default_value) const {
    auto it = attributes.find(attr_name);
    return it == attributes.end() ? default_value : it->second;
}

std::string XMLStreamReader::SimpleElement::childText(const std::string& element_name) const {
    const SimpleElement* child = findChild(element_name);
    return child ? child->text : std::string();
}

std::unique_ptr<XMLStreamReader::SimpleElement> XMLStreamReader::parseToDOM(const std::string& xml_content) {
    std::unique_ptr<SimpleElement> root;
    std::vector<SimpleElement*> stack;

    setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>& attributes, int) {
        SimpleElement* element = nullptr;
        if (stack.empty()) {
            root = std::make_unique<SimpleElement>(std::string(name));
            element = root.get();
        } else {
            auto child = std::make_unique<SimpleElement>(std::string(name));
            child->parent = stack.back();
            element = child.get();
            stack.back()->children.push_back(std::move(child));
        }
        for (const auto& attr : attributes) {
            element->attributes.emplace(std::string(attr.name), std::string(attr.value));
        }
        stack.push_back(element);
    });
    setTextCallback([&](std::string_view text, int) {
        if (!stack.empty()) {
            stack.back()->text.assign(text.data(), text.size());
        }
    });
    setEndElementCallback([&](std::string_view, int) {
        if (!stack.empty()) {
            stack.pop_back();
        }
    });

    const XMLParseError result = parseFromString(xml_content);

    start_element_callback_ = nullptr;
    text_callback_ = nullptr;
    end_element_callback_ = nullptr;

    if (isError(result) || !root) {
        throw core::XMLException(last_error_message_.empty() ? "Empty XML document" : last_error_message_,
                                 "", last_error_line_, __FILE__, __LINE__);
    }
    return root;
}

}} // namespace blobxl::xml
