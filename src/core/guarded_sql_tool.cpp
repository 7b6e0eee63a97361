#include "core/guarded_sql_tool.hpp"
#include "core/observation.hpp"
#include "core/query_input.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlguard {

GuardedSqlTool::GuardedSqlTool(AdmissionFilter filter, std::shared_ptr<IQueryExecutor> executor)
    : filter_(std::move(filter)),
      executor_(std::move(executor)) {}

std::string GuardedSqlTool::run(std::string_view args) {
    auto parsed = QueryInput::from_json(args);
    if (const auto* rejected = std::get_if<Rejected>(&parsed)) {
        invocations_.fetch_add(1, std::memory_order_relaxed);
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return render_observation(*rejected);
    }
    return run_sql(std::get<QueryInput>(parsed).sql());
}

std::string GuardedSqlTool::run_sql(std::string_view candidate) {
    invocations_.fetch_add(1, std::memory_order_relaxed);

    const auto verdict = filter_.admit(candidate);

    return std::visit(overloaded{
        [this](const Rejected& rejected) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            utils::log::info(std::format("{}: rejected ({})",
                tool::kName, rejection_reason_to_string(rejected.reason)));
            return render_observation(rejected);
        },
        [this](const Accepted& accepted) {
            executed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format("{}: executing {}", tool::kName, accepted.final_text));
            return render_observation(executor_->execute(accepted.final_text));
        },
    }, verdict);
}

} // namespace sqlguard
