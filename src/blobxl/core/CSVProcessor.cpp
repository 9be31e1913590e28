#include "blobxl/core/CSVProcessor.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <fast_float/fast_float.h>
#include <utf8.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace blobxl {
namespace core {

namespace {

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trimAscii(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isAsciiSpace(s[begin])) ++begin;
    while (end > begin && isAsciiSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
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

} // namespace

std::vector<std::string> CSVOptions::defaultMissingValues() {
    return {"", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan",
            "1.#IND", "1.#QNAN", "<NA>", "N/A", "NA", "NULL", "NaN", "None",
            "n/a", "nan", "null"};
}

void validateUtf8(std::string_view content, const std::string& source_name) {
    auto invalid = utf8::find_invalid(content.begin(), content.end());
    if (invalid == content.end()) {
        return;
    }

    const size_t position = static_cast<size_t>(invalid - content.begin());
    const auto byte = static_cast<unsigned char>(*invalid);
    const char* reason = "invalid continuation byte";
    if ((byte >= 0x80 && byte <= 0xBF) || byte >= 0xF8) {
        reason = "invalid start byte";
    } else if (position + 4 > content.size()) {
        reason = "unexpected end of data";
    }

    throw ParseException(
        fmt::format("'utf-8' codec can't decode byte 0x{:02x} in position {}: {}", byte, position, reason),
        source_name, __FILE__, __LINE__);
}

std::string_view stripBom(std::string_view content, bool* had_bom) {
    static constexpr std::string_view kBom = "\xEF\xBB\xBF";
    const bool bom = content.substr(0, kBom.size()) == kBom;
    if (had_bom) {
        *had_bom = bom;
    }
    return bom ? content.substr(kBom.size()) : content;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& raw) {
    std::vector<std::string> names;
    names.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        names.push_back(raw[i].empty() ? fmt::format("Unnamed: {}", i) : raw[i]);
    }

    // 重名去重："x" -> "x.1" -> "x.2"，新名字若再冲突则继续递增
    std::unordered_map<std::string, size_t> counts;
    for (auto& name : names) {
        std::string col = name;
        size_t cur_count = counts[col];
        while (cur_count > 0) {
            counts[col] = cur_count + 1;
            col = fmt::format("{}.{}", col, cur_count);
            cur_count = counts[col];
        }
        name = col;
        counts[col] = cur_count + 1;
    }
    return names;
}

std::optional<double> parseNumber(std::string_view text) {
    std::string_view s = trimAscii(text);
    if (s.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (s.front() == '+' || s.front() == '-') {
        negative = s.front() == '-';
        s.remove_prefix(1);
        if (s.empty() || s.front() == '+' || s.front() == '-') {
            return std::nullopt;
        }
    }

    if (equalsIgnoreCase(s, "inf") || equalsIgnoreCase(s, "infinity")) {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }

    double value = 0.0;
    auto result = fast_float::from_chars(s.data(), s.data() + s.size(), value);
    // 上溢/下溢时 fast_float 仍写入 ±inf 或 ±0
    const bool parsed = result.ec == std::errc() || result.ec == std::errc::result_out_of_range;
    if (!parsed || result.ptr != s.data() + s.size() || std::isnan(value)) {
        return std::nullopt;
    }
    // fast_float 自身也接受 inf 拼写，其他拼写按文本处理
    if (std::isinf(value) && !std::isdigit(static_cast<unsigned char>(s.front())) && s.front() != '.') {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::optional<bool> parseBoolean(std::string_view text) {
    if (text == "True" || text == "TRUE" || text == "true") {
        return true;
    }
    if (text == "False" || text == "FALSE" || text == "false") {
        return false;
    }
    return std::nullopt;
}

std::vector<CSVRecord> CSVProcessor::tokenize(std::string_view content, const std::string& source_name) const {
    enum class State { StartField, InField, InQuoted, QuoteInQuoted };

    std::vector<CSVRecord> records;
    CSVRecord current;
    std::string field;
    State state = State::StartField;
    bool significant = false;   // 本记录出现过分隔符、引号或非空白字符
    size_t line = 1;
    current.line = line;

    auto endField = [&]() {
        current.fields.push_back(std::move(field));
        field.clear();
    };

    auto endRecord = [&]() {
        endField();
        const bool blank = current.fields.size() == 1 && !significant;
        if (!(options_.skip_blank_lines && blank)) {
            records.push_back(std::move(current));
        }
        current = CSVRecord{};
        significant = false;
    };

    const size_t n = content.size();
    for (size_t i = 0; i < n; ++i) {
        const char c = content[i];
        const bool newline = (c == '\n' || c == '\r');
        size_t newline_width = 1;
        if (c == '\r' && i + 1 < n && content[i + 1] == '\n') {
            newline_width = 2;
        }

        switch (state) {
            case State::StartField:
                if (c == options_.quote_char) {
                    state = State::InQuoted;
                    significant = true;
                } else if (c == options_.delimiter) {
                    endField();
                    significant = true;
                } else if (newline) {
                    endRecord();
                } else {
                    field.push_back(c);
                    state = State::InField;
                    if (c != ' ' && c != '\t') significant = true;
                }
                break;

            case State::InField:
                if (c == options_.delimiter) {
                    endField();
                    significant = true;
                    state = State::StartField;
                } else if (newline) {
                    endRecord();
                    state = State::StartField;
                } else {
                    field.push_back(c);
                    if (c != ' ' && c != '\t') significant = true;
                }
                break;

            case State::InQuoted:
                if (c == options_.quote_char) {
                    state = State::QuoteInQuoted;
                } else {
                    // 引号内换行原样保留
                    field.push_back(c);
                    if (newline_width == 2) {
                        field.push_back('\n');
                    }
                }
                break;

            case State::QuoteInQuoted:
                if (c == options_.quote_char) {
                    field.push_back(c);
                    state = State::InQuoted;
                } else if (c == options_.delimiter) {
                    endField();
                    state = State::StartField;
                } else if (newline) {
                    endRecord();
                    state = State::StartField;
                } else {
                    field.push_back(c);
                    state = State::InField;
                }
                break;
        }

        if (newline) {
            i += newline_width - 1;
            ++line;
            if (state == State::StartField && current.fields.empty() && field.empty()) {
                current.line = line;
            }
        }
    }

    if (state == State::InQuoted) {
        throw ParseException(
            fmt::format("Error tokenizing data. EOF inside string starting at line {}", current.line),
            source_name, __FILE__, __LINE__);
    }
    if (state != State::StartField || !current.fields.empty() || !field.empty()) {
        endRecord();
    }

    return records;
}

bool CSVProcessor::isMissing(std::string_view value) const {
    return std::find(options_.na_values.begin(), options_.na_values.end(), value) != options_.na_values.end();
}

ColumnKind CSVProcessor::inferColumn(const std::vector<CSVRecord>& records, size_t col) const {
    bool any_value = false;
    bool all_bool = true;
    bool all_numeric = true;

    // records[0] 为表头
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& fields = records[r].fields;
        if (col >= fields.size() || isMissing(fields[col])) {
            continue;
        }
        any_value = true;
        if (all_bool && !parseBoolean(fields[col])) {
            all_bool = false;
        }
        if (all_numeric && !parseNumber(fields[col])) {
            all_numeric = false;
        }
        if (!all_bool && !all_numeric) {
            return ColumnKind::Text;
        }
    }

    if (!any_value) return ColumnKind::Empty;
    if (all_bool) return ColumnKind::Boolean;
    return ColumnKind::Numeric;
}

Cell CSVProcessor::convert(const std::string& raw, ColumnKind kind) const {
    if (isMissing(raw)) {
        return Cell();
    }
    switch (kind) {
        case ColumnKind::Boolean:
            return Cell::boolean(*parseBoolean(raw));
        case ColumnKind::Numeric: {
            double value = *parseNumber(raw);
            if (std::isinf(value)) {
                return Cell::string(value > 0 ? "inf" : "-inf");
            }
            return Cell::number(value);
        }
        case ColumnKind::Text:
        case ColumnKind::Empty:
        default:
            return Cell::string(raw);
    }
}

Table CSVProcessor::parse(std::string_view content, const std::string& source_name) {
    info_ = CSVParseInfo{};

    validateUtf8(content, source_name);
    content = stripBom(content, &info_.had_bom);

    std::vector<CSVRecord> records = tokenize(content, source_name);
    info_.records_parsed = records.size();
    if (records.empty()) {
        throw ParseException("No columns to parse from file", source_name, __FILE__, __LINE__);
    }

    std::vector<std::string> columns = normalizeHeader(records.front().fields);
    const size_t width = columns.size();

    for (size_t r = 1; r < records.size(); ++r) {
        auto& fields = records[r].fields;
        if (fields.size() > width) {
            throw ParseException(
                fmt::format("Error tokenizing data. Expected {} fields in line {}, saw {}",
                            width, records[r].line, fields.size()),
                source_name, __FILE__, __LINE__);
        }
        if (fields.size() < width) {
            fields.resize(width);
            ++info_.padded_rows;
        }
    }

    std::vector<ColumnKind> kinds(width, ColumnKind::Text);
    if (options_.infer_types) {
        for (size_t c = 0; c < width; ++c) {
            kinds[c] = inferColumn(records, c);
        }
    }

    std::vector<Table::Row> rows;
    rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        Table::Row row;
        row.reserve(width);
        for (size_t c = 0; c < width; ++c) {
            row.push_back(convert(records[r].fields[c], kinds[c]));
        }
        rows.push_back(std::move(row));
    }

    info_.rows_parsed = rows.size();
    info_.column_names = columns;

    CSV_DEBUG("Parsed {}: {} columns, {} rows ({} padded), bom={}",
              source_name.empty() ? "<memory>" : source_name,
              width, info_.rows_parsed, info_.padded_rows, info_.had_bom);

    return Table(std::move(columns), std::move(rows));
}

}} // namespace blobxl::core
