/**
 * @file editor.cpp
 * @brief Editor lookup, templating and session handling.
 */

#include "tasks/editor.hpp"
#include "sandbox/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace sandbox_runner {

namespace {

/// Removes the scratch file on every exit path.
class ScratchFile {
public:
    explicit ScratchFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

std::string_view editor_extension(std::string_view language) noexcept {
    if (language == "python")     return ".py";
    if (language == "javascript") return ".js";
    if (language == "typescript") return ".ts";
    if (language == "bash")       return ".sh";
    if (language == "r")          return ".r";
    if (language == "java")       return ".java";
    return ".py";
}

std::string editor_template(std::string_view language) {
    std::string comment = "# ";
    if (language == "javascript" || language == "typescript" || language == "java") {
        comment = "// ";
    }
    std::string lang{language};
    return comment + "SandboxRunner Code Editor\n"
         + comment + "Write your " + lang + " code below, save and exit to execute.\n"
         + comment + "Leave empty or unchanged to cancel.\n\n";
}

std::string trim(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n\v\f";
    auto begin = text.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(kSpace);
    return std::string{text.substr(begin, end - begin + 1)};
}

Result<std::string> choose_editor() {
    for (const char* var : {"EDITOR", "VISUAL"}) {
        if (const char* value = std::getenv(var); value && *value) {
            return std::string{value};
        }
    }
    for (const char* candidate : {"vim", "vi", "nano"}) {
        if (find_on_path(candidate)) return std::string{candidate};
    }
    return Error{ErrorKind::Build, "no editor found: set $EDITOR environment variable"};
}

Result<std::string> open_editor(std::string_view language) {
    auto editor = choose_editor();
    if (!editor) return editor.error();

    auto pattern = (std::filesystem::temp_directory_path() / "sandbox-runner-XXXXXX").string()
                 + std::string{editor_extension(language)};
    std::string buffer = pattern;
    int fd = mkstemps(buffer.data(), static_cast<int>(editor_extension(language).size()));
    if (fd < 0) {
        return Error{ErrorKind::Build, std::string{"failed to create temp file: "} + std::strerror(errno)};
    }
    close(fd);
    ScratchFile scratch{buffer};

    const std::string tmpl = editor_template(language);
    {
        std::ofstream out(scratch.path(), std::ios::trunc);
        out << tmpl;
        if (!out) {
            return Error{ErrorKind::Build, "failed to write template"};
        }
    }

    // Through the shell so EDITOR may carry arguments ("code --wait").
    auto status = run_interactive({"/bin/sh", "-c", *editor + " \"$1\"", "sh", scratch.path().string()});
    if (!status) return status.error().wrap("editor exited with error");
    if (*status != 0) {
        return Error{ErrorKind::Build, "editor exited with error: exit status " + std::to_string(*status)};
    }

    std::ifstream in(scratch.path());
    if (!in) {
        return Error{ErrorKind::Build, "failed to read edited file"};
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    auto code = trim(contents.str());
    if (code.empty() || code == trim(tmpl)) {
        return std::string{};
    }
    return code;
}

}  // namespace sandbox_runner
