#include "core/observation.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace sqlguard {

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// PostgreSQL sends booleans as t/f, MySQL has no boolean result type
std::string_view boolean_literal(std::string_view value) {
    const std::string lower = utils::to_lower(value);
    if (lower == "t" || lower == "true") return "true";
    if (lower == "f" || lower == "false") return "false";
    return {};
}

std::string quoted(std::string_view value) {
    return std::format("\"{}\"", utils::escape_json(value));
}

} // anonymous namespace

bool is_json_number(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();

    if (i < n && text[i] == '-') ++i;
    if (i == n) return false;

    if (text[i] == '0') {
        ++i;
    } else if (is_digit(text[i])) {
        while (i < n && is_digit(text[i])) ++i;
    } else {
        return false;
    }

    if (i < n && text[i] == '.') {
        ++i;
        if (i == n || !is_digit(text[i])) return false;
        while (i < n && is_digit(text[i])) ++i;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        if (i == n || !is_digit(text[i])) return false;
        while (i < n && is_digit(text[i])) ++i;
    }

    return i == n;
}

std::string render_cell(const Cell& cell, GenericColumnType type) {
    if (!cell) {
        return "null";
    }

    const std::string& value = *cell;

    // NaN, Infinity and similar values have no JSON number form
    if (is_numeric_type(type) && is_json_number(value)) {
        return value;
    }

    if (type == GenericColumnType::BOOLEAN) {
        if (const auto literal = boolean_literal(value); !literal.empty()) {
            return std::string(literal);
        }
    }

    return quoted(value);
}

std::string render_observation(const Rejected& rejected) {
    return rejection_message(rejected.reason);
}

std::string render_observation(const ExecutionError& error) {
    return std::format("ERROR: {}", utils::trim_trailing_newlines(error.message));
}

std::string render_observation(const QueryRows& rows) {
    std::string out;
    out.reserve(64 + rows.rows.size() * rows.columns.size() * 8);

    out += "{\"columns\":[";
    for (size_t i = 0; i < rows.columns.size(); ++i) {
        if (i > 0) out += ',';
        out += quoted(rows.columns[i]);
    }

    out += "],\"rows\":[";
    for (size_t r = 0; r < rows.rows.size(); ++r) {
        if (r > 0) out += ',';
        out += '[';
        const auto& row = rows.rows[r];
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) out += ',';
            const auto type = c < rows.column_types.size()
                ? rows.column_types[c] : GenericColumnType::UNKNOWN;
            out += render_cell(row[c], type);
        }
        out += ']';
    }
    out += "]}";

    return out;
}

std::string render_observation(const QueryResult& result) {
    return std::visit(overloaded{
        [](const QueryRows& rows) { return render_observation(rows); },
        [](const ExecutionError& error) { return render_observation(error); },
    }, result);
}

} // namespace sqlguard
