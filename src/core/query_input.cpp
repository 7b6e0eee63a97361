#include "core/query_input.hpp"
#include "core/utils.hpp"

#include <glaze/glaze.hpp>

namespace sqlguard {

std::variant<QueryInput, Rejected> QueryInput::from_json(std::string_view args) {
    const std::string buffer(args);
    glz::json_t doc;
    if (auto ec = glz::read_json(doc, buffer)) {
        utils::log::debug("tool input: malformed JSON arguments");
        return Rejected{RejectionReason::INVALID_INPUT};
    }

    if (!doc.is_object()) {
        utils::log::debug("tool input: arguments are not an object");
        return Rejected{RejectionReason::INVALID_INPUT};
    }

    const auto& obj = doc.get_object();
    const auto it = obj.find(std::string(tool::kSqlArgument));
    if (it == obj.end() || !it->second.is_string()) {
        utils::log::debug("tool input: missing or non-string 'sql' argument");
        return Rejected{RejectionReason::INVALID_INPUT};
    }

    return QueryInput(it->second.get_string());
}

} // namespace sqlguard
