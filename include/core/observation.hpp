#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Render outcomes into the observation text handed to the agent loop
 *
 * - Rejected       -> fixed rejection text ("ERROR: ... not allowed.")
 * - ExecutionError -> "ERROR: <message>"
 * - QueryRows      -> {"columns":[...],"rows":[[...],...]}
 *
 * Numeric and boolean cells are emitted unquoted, SQL NULL as null,
 * everything else as a JSON string.
 */
[[nodiscard]] std::string render_observation(const Rejected& rejected);
[[nodiscard]] std::string render_observation(const ExecutionError& error);
[[nodiscard]] std::string render_observation(const QueryRows& rows);
[[nodiscard]] std::string render_observation(const QueryResult& result);

/**
 * @brief Render a single cell as a JSON value
 */
[[nodiscard]] std::string render_cell(const Cell& cell, GenericColumnType type);

/**
 * @brief True if @p text is a complete JSON number literal (RFC 8259)
 */
[[nodiscard]] bool is_json_number(std::string_view text);

} // namespace sqlguard
