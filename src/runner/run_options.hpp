/**
 * @file run_options.hpp
 * @brief Immutable run-time settings handed to the runners.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sandbox_runner {

/**
 * @brief Folded from configuration and command-line flags once, then passed
 *        by const reference.
 */
struct RunOptions {
    std::optional<InstanceId> instance_id;       ///< connect instead of create
    std::string tool{kDefaultTool};
    std::string language{kDefaultLanguage};
    bool keep_alive{false};
    bool stream{false};
    bool time{false};
    bool parallel{false};
    int max_parallel{0};                         ///< <= 0 means one slot per task
    OutputFormat format{OutputFormat::Text};
    std::chrono::seconds timeout{300};           ///< sandbox lifetime and per-call limit
};

}  // namespace sandbox_runner
