#include "blobxl/core/Cell.hpp"
#include <fmt/format.h>

namespace blobxl {
namespace core {

Cell Cell::number(double value) {
    Cell cell;
    cell.type_ = CellType::Number;
    cell.number_ = value;
    return cell;
}

Cell Cell::boolean(bool value) {
    Cell cell;
    cell.type_ = CellType::Boolean;
    cell.boolean_ = value;
    return cell;
}

Cell Cell::string(std::string value) {
    Cell cell;
    cell.type_ = CellType::String;
    cell.text_ = std::move(value);
    return cell;
}

std::string Cell::toString() const {
    switch (type_) {
        case CellType::Number:
            return fmt::format("{:.16G}", number_);
        case CellType::Boolean:
            return boolean_ ? "TRUE" : "FALSE";
        case CellType::String:
            return text_;
        case CellType::Empty:
        default:
            return std::string();
    }
}

bool Cell::operator==(const Cell& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case CellType::Number:  return number_ == other.number_;
        case CellType::Boolean: return boolean_ == other.boolean_;
        case CellType::String:  return text_ == other.text_;
        default:                return true;
    }
}

}} // namespace blobxl::core
