/**
 * @file json.hpp
 * @brief Minimal JSON string escaping for hand-built NDJSON and JSON output.
 */

#pragma once

#include <string>
#include <string_view>

namespace sandbox_runner {

/// Escape a string for use inside a JSON string literal (no surrounding quotes).
std::string json_escape(std::string_view text);

/// Escape and wrap in double quotes.
inline std::string json_quote(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

}  // namespace sandbox_runner
