#pragma once

#include "core/column_type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sqlguard {

// ============================================================================
// Admission
// ============================================================================

enum class RejectionReason : uint8_t {
    WRITE_OPERATION_FORBIDDEN,
    MULTIPLE_STATEMENTS_FORBIDDEN,
    ONLY_SELECT_ALLOWED,
    INVALID_INPUT           // Tool-call arguments failed structural validation
};

[[nodiscard]] inline const char* rejection_reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::WRITE_OPERATION_FORBIDDEN:     return "write_operation_forbidden";
        case RejectionReason::MULTIPLE_STATEMENTS_FORBIDDEN: return "multiple_statements_forbidden";
        case RejectionReason::ONLY_SELECT_ALLOWED:           return "only_select_allowed";
        case RejectionReason::INVALID_INPUT:                 return "invalid_input";
        default:                                             return "unknown";
    }
}

/**
 * @brief Human-readable rejection text handed back to the agent loop
 */
[[nodiscard]] inline const char* rejection_message(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::WRITE_OPERATION_FORBIDDEN:
            return "ERROR: write operations are not allowed.";
        case RejectionReason::MULTIPLE_STATEMENTS_FORBIDDEN:
            return "ERROR: multiple statements are not allowed.";
        case RejectionReason::ONLY_SELECT_ALLOWED:
            return "ERROR: only SELECT statements are allowed.";
        case RejectionReason::INVALID_INPUT:
            return "ERROR: expected a single SQL string argument.";
        default:
            return "ERROR: query rejected.";
    }
}

struct Accepted {
    std::string final_text;
};

struct Rejected {
    RejectionReason reason;
};

/**
 * @brief Outcome of admission: exactly one per candidate query, immutable
 */
using AdmissionVerdict = std::variant<Accepted, Rejected>;

// ============================================================================
// Query Results
// ============================================================================

// SQL NULL is std::nullopt; every other value keeps the driver's text form
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

struct QueryRows {
    std::vector<std::string> columns;
    std::vector<GenericColumnType> column_types;   // Parallel to columns
    std::vector<Row> rows;
};

struct ExecutionError {
    std::string message;
};

/**
 * @brief Outcome of executing an accepted query
 *
 * Only ever produced for an Accepted verdict.
 */
using QueryResult = std::variant<QueryRows, ExecutionError>;

// Visitor helper for std::visit over the result variants
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

// ============================================================================
// Schema Types
// ============================================================================

struct ColumnMetadata {
    std::string name;
    std::string type;           // Vendor type name as reported by information_schema
    GenericColumnType generic_type;
    bool nullable;
    bool is_primary_key;

    ColumnMetadata()
        : generic_type(GenericColumnType::UNKNOWN), nullable(true), is_primary_key(false) {}
};

struct TableMetadata {
    std::string schema;
    std::string name;
    std::vector<ColumnMetadata> columns;
    std::unordered_map<std::string, size_t> column_index; // name -> index

    const ColumnMetadata* find_column(const std::string& col_name) const {
        auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }

    ColumnMetadata* find_column(const std::string& col_name) {
        auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }
};

// Keyed by lowercase "schema.table"
using SchemaMap = std::unordered_map<std::string, std::shared_ptr<TableMetadata>>;

} // namespace sqlguard
