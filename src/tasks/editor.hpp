/**
 * @file editor.hpp
 * @brief Interactive editor session used when no code was supplied.
 */

#pragma once

#include "core/result.hpp"

#include <string>
#include <string_view>

namespace sandbox_runner {

/// Scratch-file extension for a language (".py" when unknown).
std::string_view editor_extension(std::string_view language) noexcept;

/// Comment template written into the buffer before the editor opens.
std::string editor_template(std::string_view language);

/**
 * @brief $EDITOR, then $VISUAL, then the first of vim, vi, nano on PATH.
 */
Result<std::string> choose_editor();

/**
 * @brief Open the editor on a template and return what the user wrote.
 *
 * Returns an empty string when the buffer is empty or still equals the
 * template after trimming.
 */
Result<std::string> open_editor(std::string_view language);

/// Strip leading and trailing whitespace.
std::string trim(std::string_view text);

}  // namespace sandbox_runner
