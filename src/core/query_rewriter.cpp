#include "core/query_rewriter.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <regex>

namespace sqlguard {

namespace {

const std::regex& limit_regex() {
    static const std::regex re(R"(\blimit\s+\d+\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

const std::regex& aggregate_regex() {
    static const std::regex re(
        R"(\bcount\(|\bgroup\s+by\b|\bsum\(|\bavg\(|\bmax\(|\bmin\()",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

} // anonymous namespace

std::string QueryRewriter::scan_form(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());
    for (char c : sql) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            if (!out.empty() && out.back() == ' ') continue;
            c = ' ';
        } else if (std::isdigit(uc)) {
            if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.back()))) continue;
        }
        out += c;
    }
    return out;
}

// libstdc++ recurses once per character matched by \s+ or \d+, so both
// scans run on scan_form(). A regex_error still reports no match.
bool QueryRewriter::has_limit_clause(std::string_view sql) {
    const std::string scanned = scan_form(sql);
    try {
        return std::regex_search(scanned, limit_regex());
    } catch (const std::regex_error& e) {
        utils::log::warn(std::format("rewriter: LIMIT scan aborted: {}", e.what()));
        return false;
    }
}

bool QueryRewriter::has_aggregate(std::string_view sql) {
    const std::string scanned = scan_form(sql);
    try {
        return std::regex_search(scanned, aggregate_regex());
    } catch (const std::regex_error& e) {
        utils::log::warn(std::format("rewriter: aggregate scan aborted: {}", e.what()));
        return false;
    }
}

std::string QueryRewriter::rewrite(const std::string& sql) const {
    if (has_limit_clause(sql) || has_aggregate(sql)) {
        return {};
    }
    return enforce_limit(sql, config_.default_limit);
}

std::string QueryRewriter::enforce_limit(const std::string& sql, int limit_value) {
    std::string result = sql;
    result += std::format(" LIMIT {}", limit_value);
    return result;
}

} // namespace sqlguard
