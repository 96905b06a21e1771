#include "masklint/lint/language_handler.hpp"

#include <ostream>
#include <sstream>
#include <vector>

#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::lint {

namespace {

constexpr const char* WHITESPACE = " \t\r\n\v\f";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(WHITESPACE);
    return s.substr(begin, end - begin + 1);
}

std::string replace_all(std::string text, const std::string& from,
                        const std::string& to) {
    if (from.empty()) {
        return text;
    }
    for (size_t pos = 0; (pos = text.find(from, pos)) != std::string::npos;) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += lines[i];
    }
    return joined;
}

const std::string& executable_for(LanguageHandler handler,
                                  const LinterConfig& linters) {
    switch (handler) {
        case LanguageHandler::Shellcheck:
            return linters.shellcheck;
        case LanguageHandler::Ruff:
            return linters.ruff;
        case LanguageHandler::Rubocop:
            return linters.rubocop;
        case LanguageHandler::Catchall:
            break;
    }
    throw Error("no executable configured for catchall handler");
}

std::vector<std::string> arguments_for(LanguageHandler handler,
                                       const std::string& path) {
    switch (handler) {
        case LanguageHandler::Shellcheck:
            return {path};
        case LanguageHandler::Ruff:
            return {"check", "--output-format=full", "--no-cache", path};
        case LanguageHandler::Rubocop:
            return {"--format=clang", "--display-style-guide", path};
        case LanguageHandler::Catchall:
            break;
    }
    return {};
}

}  // namespace

LanguageHandler handler_for_executor(const std::string& executor) {
    if (executor == "sh" || executor == "bash" || executor == "zsh") {
        return LanguageHandler::Shellcheck;
    }
    if (executor == "py" || executor == "python") {
        return LanguageHandler::Ruff;
    }
    if (executor == "rb" || executor == "ruby") {
        return LanguageHandler::Rubocop;
    }
    return LanguageHandler::Catchall;
}

const char* handler_name(LanguageHandler handler) {
    switch (handler) {
        case LanguageHandler::Catchall:
            return "catchall";
        case LanguageHandler::Shellcheck:
            return "shellcheck";
        case LanguageHandler::Ruff:
            return "ruff";
        case LanguageHandler::Rubocop:
            return "rubocop";
    }
    return "catchall";
}

const char* file_extension(LanguageHandler handler) {
    switch (handler) {
        case LanguageHandler::Shellcheck:
            return ".sh";
        case LanguageHandler::Ruff:
            return ".py";
        case LanguageHandler::Rubocop:
            return ".rb";
        case LanguageHandler::Catchall:
            return "";
    }
    return "";
}

std::string transform_content(LanguageHandler handler,
                              const maskfile::Script& script) {
    switch (handler) {
        case LanguageHandler::Shellcheck:
            // Interpreter path is intentionally "/bin/usr/env"
            return "#!/bin/usr/env " + script.executor + "\n" + script.source;
        case LanguageHandler::Ruff:
        case LanguageHandler::Rubocop:
        case LanguageHandler::Catchall:
            return script.source;
    }
    return script.source;
}

std::string normalize_shellcheck_output(const std::string& raw,
                                        const std::string& path) {
    return replace_all(trim(raw), path + " ", "");
}

std::string normalize_ruff_output(const std::string& raw,
                                  const std::string& path) {
    const std::string prefix = path + ":";
    std::vector<std::string> kept;
    for (const auto& line : split_lines(trim(raw))) {
        if (line == "All checks passed!") {
            continue;
        }
        // Summary footer, e.g. "Found 2 errors."
        if (line.rfind("Found ", 0) == 0) {
            break;
        }
        kept.push_back(replace_all(line, prefix, "line "));
    }
    return trim(join_lines(kept));
}

std::string normalize_rubocop_output(const std::string& raw,
                                     const std::string& path) {
    std::vector<std::string> kept;
    for (const auto& line : split_lines(raw)) {
        if (line.find("1 file inspected") != std::string::npos) {
            continue;
        }
        kept.push_back(line);
    }
    return replace_all(trim(join_lines(kept)), path + ":", "line ");
}

std::string execute(LanguageHandler handler, const std::filesystem::path& path,
                    IProcessRunner& runner, const LinterConfig& linters) {
    if (handler == LanguageHandler::Catchall) {
        return NO_LINTER_FINDING;
    }

    const std::string path_str = path.string();
    const std::string& program = executable_for(handler, linters);

    ProcessOutput output;
    try {
        output = runner.run(program, arguments_for(handler, path_str));
    } catch (const ExecutableNotFoundError& e) {
        MASKLINT_LOG_DEBUG << "Linter executable '" << e.program()
                           << "' for " << handler_name(handler)
                           << " was not found";
        throw LinterNotFoundError(handler_name(handler));
    }

    MASKLINT_LOG_INFO << handler_name(handler) << " checked " << path_str
                      << " (exit code " << output.exit_code << ")";

    switch (handler) {
        case LanguageHandler::Shellcheck:
            return normalize_shellcheck_output(output.stdout_text, path_str);
        case LanguageHandler::Ruff:
            return normalize_ruff_output(output.stdout_text, path_str);
        case LanguageHandler::Rubocop:
            return normalize_rubocop_output(output.stdout_text, path_str);
        case LanguageHandler::Catchall:
            break;
    }
    return NO_LINTER_FINDING;
}

std::ostream& operator<<(std::ostream& os, LanguageHandler handler) {
    return os << handler_name(handler);
}

}  // namespace masklint::lint
