/**
 * @file result_aggregator.cpp
 * @brief Batch summary and exit-code derivation.
 */

#include "runner/result_aggregator.hpp"

#include <algorithm>

namespace sandbox_runner {

Summary summarize(const std::vector<TaskResult>& results, Duration duration) {
    Summary summary;
    summary.total = results.size();
    summary.failed = static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const TaskResult& r) { return r.failed(); }));
    summary.succeeded = summary.total - summary.failed;
    summary.duration = duration;
    return summary;
}

int exit_code(const Summary& summary) noexcept {
    if (summary.failed == 0) return 0;
    if (summary.failed == summary.total) return 2;
    return 1;
}

}  // namespace sandbox_runner
