#include "security/admission_filter.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>

namespace sqlguard {

namespace {

constexpr char kStatementTerminator = ';';

const std::regex& write_keyword_regex() {
    static const std::regex re(
        R"(\b(INSERT|UPDATE|DELETE|DROP|TRUNCATE|ALTER|CREATE|REPLACE)\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

const std::regex& select_prefix_regex() {
    static const std::regex re(R"(^select\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

} // anonymous namespace

std::string AdmissionFilter::normalize(std::string_view text) {
    std::string s = utils::trim(text);
    if (!s.empty() && s.back() == kStatementTerminator) {
        s.pop_back();
    }
    return s;
}

// The keyword pattern has no repetition, so matching depth does not grow
// with input length. A regex_error, where the library throws one, rejects.
bool AdmissionFilter::contains_write_keyword(std::string_view sql) {
    try {
        return std::regex_search(sql.begin(), sql.end(), write_keyword_regex());
    } catch (const std::regex_error& e) {
        utils::log::warn(std::format("admission: keyword scan aborted: {}", e.what()));
        return true;
    }
}

bool AdmissionFilter::starts_with_select(std::string_view sql) {
    const auto start = sql.find_first_not_of(" \t\n\v\f\r");
    if (start == std::string_view::npos) {
        return false;
    }
    sql.remove_prefix(start);
    try {
        return std::regex_search(sql.begin(), sql.end(), select_prefix_regex());
    } catch (const std::regex_error& e) {
        utils::log::warn(std::format("admission: prefix check aborted: {}", e.what()));
        return false;
    }
}

AdmissionVerdict AdmissionFilter::admit(std::string_view text) const {
    std::string s = normalize(text);

    if (contains_write_keyword(s)) {
        utils::log::debug("admission: rejected write operation");
        return Rejected{RejectionReason::WRITE_OPERATION_FORBIDDEN};
    }

    if (s.find(kStatementTerminator) != std::string::npos) {
        utils::log::debug("admission: rejected multiple statements");
        return Rejected{RejectionReason::MULTIPLE_STATEMENTS_FORBIDDEN};
    }

    if (!starts_with_select(s)) {
        utils::log::debug("admission: rejected non-SELECT statement");
        return Rejected{RejectionReason::ONLY_SELECT_ALLOWED};
    }

    std::string rewritten = rewriter_.rewrite(s);
    if (!rewritten.empty()) {
        utils::log::debug(std::format("admission: bounded with LIMIT {}", rewriter_.default_limit()));
        s = std::move(rewritten);
    }

    return Accepted{std::move(s)};
}

} // namespace sqlguard
