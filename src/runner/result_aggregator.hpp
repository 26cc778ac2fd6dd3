/**
 * @file result_aggregator.hpp
 * @brief Success/failure counts and the process exit code for a batch.
 */

#pragma once

#include "runner/task_result.hpp"

#include <cstddef>
#include <vector>

namespace sandbox_runner {

struct Summary {
    size_t total{0};
    size_t succeeded{0};
    size_t failed{0};
    Duration duration{0};
};

/**
 * @brief Count results. Pure; calling it twice gives the same summary.
 */
[[nodiscard]] Summary summarize(const std::vector<TaskResult>& results, Duration duration = Duration{0});

/**
 * @brief 0 when nothing failed, 2 when everything failed, 1 otherwise.
 */
[[nodiscard]] int exit_code(const Summary& summary) noexcept;

}  // namespace sandbox_runner
