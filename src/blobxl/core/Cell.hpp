#pragma once

#include <string>
#include <cstdint>

namespace blobxl {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Number = 1,
    String = 2,
    Boolean = 3
};

/**
 * @brief 类型化单元格值
 */
class Cell {
public:
    Cell() = default;

    static Cell number(double value);
    static Cell boolean(bool value);
    static Cell string(std::string value);

    CellType getType() const { return type_; }
    bool isEmpty() const { return type_ == CellType::Empty; }
    bool isNumber() const { return type_ == CellType::Number; }
    bool isString() const { return type_ == CellType::String; }
    bool isBoolean() const { return type_ == CellType::Boolean; }

    double getNumberValue() const { return number_; }
    bool getBooleanValue() const { return boolean_; }
    const std::string& getStringValue() const { return text_; }

    /**
     * @brief 文本表示（数字使用最多16位有效数字）
     */
    std::string toString() const;

    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }

private:
    CellType type_ = CellType::Empty;
    double number_ = 0.0;
    bool boolean_ = false;
    std::string text_;
};

}} // namespace blobxl::core
