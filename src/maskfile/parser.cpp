#include "masklint/maskfile/parser.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::maskfile {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// Number of leading spaces, markdown allows up to three before a block marker
size_t indent_of(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && line[i] == ' ') {
        ++i;
    }
    return i;
}

struct Heading {
    int level = 0;
    std::string text;
};

bool parse_heading(const std::string& line, Heading& heading) {
    size_t pos = indent_of(line);
    if (pos > 3) {
        return false;
    }
    int level = 0;
    while (pos < line.size() && line[pos] == '#') {
        ++level;
        ++pos;
    }
    if (level == 0 || level > 6) {
        return false;
    }
    if (pos < line.size() && line[pos] != ' ' && line[pos] != '\t') {
        return false;
    }

    std::string text = trim(line.substr(pos));
    // Optional closing sequence: "## build ##"
    const auto last = text.find_last_not_of('#');
    if (last == std::string::npos) {
        text.clear();
    } else if (last + 1 < text.size() &&
               (text[last] == ' ' || text[last] == '\t')) {
        text = trim(text.substr(0, last + 1));
    }

    heading.level = level;
    heading.text = text;
    return true;
}

struct Fence {
    char marker = '`';
    size_t length = 0;
    std::string info;
};

bool parse_fence_open(const std::string& line, Fence& fence) {
    size_t pos = indent_of(line);
    if (pos > 3 || pos >= line.size()) {
        return false;
    }
    const char marker = line[pos];
    if (marker != '`' && marker != '~') {
        return false;
    }
    size_t length = 0;
    while (pos < line.size() && line[pos] == marker) {
        ++length;
        ++pos;
    }
    if (length < 3) {
        return false;
    }
    std::string info = trim(line.substr(pos));
    if (marker == '`' && info.find('`') != std::string::npos) {
        return false;
    }

    fence.marker = marker;
    fence.length = length;
    const auto space = info.find_first_of(" \t{");
    fence.info = space == std::string::npos ? info : info.substr(0, space);
    return true;
}

bool is_fence_close(const std::string& line, const Fence& fence) {
    size_t pos = indent_of(line);
    if (pos > 3) {
        return false;
    }
    size_t length = 0;
    while (pos < line.size() && line[pos] == fence.marker) {
        ++length;
        ++pos;
    }
    return length >= fence.length && trim(line.substr(pos)).empty();
}

// "> Builds the project" -> "Builds the project", nested markers included
std::string strip_blockquote(std::string text) {
    while (!text.empty() && text[0] == '>') {
        text = trim(text.substr(1));
    }
    return text;
}

std::string last_word(const std::string& name) {
    const auto space = name.find_last_of(" \t");
    return space == std::string::npos ? name : name.substr(space + 1);
}

struct OpenCommand {
    int level;
    CommandNode* node;
    bool has_script;
};

}  // namespace

std::string command_name_from_heading(const std::string& heading_text) {
    std::string name;
    name.reserve(heading_text.size());
    for (char c : heading_text) {
        if (c == '`' || c == '*') {
            continue;
        }
        name.push_back(c);
    }

    const auto paren = name.find('(');
    if (paren != std::string::npos) {
        name = name.substr(0, paren);
    }

    // Collapse inner whitespace runs
    std::istringstream words(name);
    std::string word;
    std::string collapsed;
    while (words >> word) {
        if (!collapsed.empty()) {
            collapsed.push_back(' ');
        }
        collapsed += word;
    }
    return collapsed;
}

Maskfile parse_maskfile(const std::string& content) {
    Maskfile maskfile;
    const auto lines = split_lines(content);

    std::vector<OpenCommand> stack;
    bool title_seen = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        Fence fence;
        if (parse_fence_open(line, fence)) {
            const size_t open_line = i;
            std::string body;
            bool closed = false;
            for (++i; i < lines.size(); ++i) {
                if (is_fence_close(lines[i], fence)) {
                    closed = true;
                    break;
                }
                body += lines[i];
                body.push_back('\n');
            }
            if (!closed) {
                throw SpecificationError("unterminated code block opened at line " +
                                         std::to_string(open_line + 1));
            }

            if (!stack.empty() && !stack.back().has_script) {
                stack.back().node->script = Script{fence.info, body};
                stack.back().has_script = true;
            }
            continue;
        }

        Heading heading;
        if (parse_heading(line, heading)) {
            if (heading.level == 1 && !title_seen && stack.empty() &&
                maskfile.commands.empty()) {
                maskfile.title = heading.text;
                title_seen = true;
                continue;
            }

            while (!stack.empty() && stack.back().level >= heading.level) {
                stack.pop_back();
            }

            CommandNode node;
            node.name = command_name_from_heading(heading.text);
            if (node.name.empty()) {
                throw SpecificationError("empty command heading at line " +
                                         std::to_string(i + 1));
            }

            CommandNode* inserted = nullptr;
            if (stack.empty()) {
                maskfile.commands.push_back(std::move(node));
                inserted = &maskfile.commands.back();
            } else {
                node.name = last_word(node.name);
                auto& siblings = stack.back().node->subcommands;
                siblings.push_back(std::move(node));
                inserted = &siblings.back();
            }
            stack.push_back({heading.level, inserted, false});
            continue;
        }

        if (!stack.empty() && !stack.back().has_script) {
            const std::string text = strip_blockquote(trim(line));
            if (!text.empty()) {
                auto& description = stack.back().node->description;
                if (!description.empty()) {
                    description.push_back(' ');
                }
                description += text;
            }
        }
    }

    MASKLINT_LOG_DEBUG << "Parsed maskfile with "
                       << maskfile.commands.size() << " root commands";
    return maskfile;
}

Maskfile load_maskfile(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw SpecificationError("cannot open " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw SpecificationError("cannot read " + path);
    }

    MASKLINT_LOG_INFO << "Loaded maskfile: " << path;
    return parse_maskfile(buffer.str());
}

}  // namespace masklint::maskfile
