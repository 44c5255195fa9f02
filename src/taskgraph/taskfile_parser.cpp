#include "taskgraph/taskfile_parser.hpp"
#include "taskgraph/task_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

namespace PHR {
namespace TaskGraph {

namespace {

struct LogicalLine {
    std::string text;
    size_t line;    // EN: First physical line / FR: Première ligne physique
};

bool isBlank(char c) {
    return c == ' ' || c == '\t';
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<LogicalLine> joinContinuations(const std::string& content) {
    std::vector<LogicalLine> lines;
    std::istringstream stream(content);
    std::string physical;
    size_t number = 0;
    bool continuing = false;

    while (std::getline(stream, physical)) {
        ++number;
        if (!physical.empty() && physical.back() == '\r') {
            physical.pop_back();
        }

        if (continuing) {
            size_t start = 0;
            while (start < physical.size() && isBlank(physical[start])) ++start;
            lines.back().text += ' ';
            lines.back().text += physical.substr(start);
        } else {
            lines.push_back(LogicalLine{physical, number});
        }

        std::string& current = lines.back().text;
        continuing = !current.empty() && current.back() == '\\';
        if (continuing) {
            current.pop_back();
            while (!current.empty() && isBlank(current.back())) current.pop_back();
        }
    }
    return lines;
}

class LineParser {
public:
    explicit LineParser(const std::string& source) {
        doc_.source = source;
    }

    TaskfileDocument parse(const std::string& content) {
        for (const auto& line : joinContinuations(content)) {
            line_ = line.line;
            parseLine(line.text);
        }
        return std::move(doc_);
    }

private:
    [[noreturn]] void fail(const std::string& detail) const {
        throw TaskfileSyntaxError(doc_.source, line_, detail);
    }

    Expression parseValue(const std::string& text) const {
        try {
            return parseExpression(text);
        } catch (const TaskfileSyntaxError& e) {
            throw TaskfileSyntaxError(doc_.source, line_, e.detail());
        }
    }

    void parseLine(const std::string& text) {
        if (!text.empty() && text[0] == '\t') {
            parseStep(text);
            return;
        }

        const std::string trimmed = trim(text);
        if (trimmed.empty()) {
            return;
        }
        if (trimmed[0] == '#') {
            parseComment(trimmed);
            return;
        }

        in_rule_ = false;
        current_.clear();

        const size_t eq = trimmed.find('=');
        const size_t colon = trimmed.find(':');
        if (eq != std::string::npos && (colon == std::string::npos || colon + 1 >= eq)) {
            parseAssignment(trimmed, eq);
        } else if (colon != std::string::npos) {
            parseRule(trimmed, colon);
        } else {
            fail("unrecognized line '" + trimmed + "'");
        }
    }

    void parseStep(const std::string& text) {
        std::string command = trim(text);
        if (command.empty()) {
            return;
        }
        if (!in_rule_) {
            fail("recipe line outside of a task");
        }

        TaskStep step;
        if (command[0] == '@') {
            step.silent = true;
            command = trim(command.substr(1));
        }
        step.command = parseValue(command);

        for (size_t index : current_) {
            doc_.tasks[index].steps.push_back(step);
        }
    }

    void parseComment(const std::string& text) {
        static const std::regex marker_pattern(R"(^#([A-Za-z0-9_./\-]+):[ \t]*(.*)$)");
        std::smatch match;
        if (std::regex_match(text, match, marker_pattern)) {
            doc_.markers.push_back(DescriptionMarker{match[1].str(), trim(match[2].str()), line_});
        }
    }

    void parseAssignment(const std::string& text, size_t eq) {
        AssignmentKind kind = AssignmentKind::RECURSIVE;
        size_t name_end = eq;
        if (eq > 0) {
            switch (text[eq - 1]) {
                case ':': kind = AssignmentKind::SIMPLE; name_end = eq - 1; break;
                case '?': kind = AssignmentKind::CONDITIONAL; name_end = eq - 1; break;
                case '+':
                case '!':
                    fail(std::string("unsupported assignment operator '") + text[eq - 1] + "='");
                default: break;
            }
        }

        const std::string name = trim(text.substr(0, name_end));
        const std::string value = trim(text.substr(eq + 1));

        if (name.empty()) {
            fail("missing variable name");
        }
        for (char c : name) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '$') {
                fail("invalid variable name '" + name + "'");
            }
        }

        if (name == ".DEFAULT_GOAL") {
            if (value.empty()) {
                fail(".DEFAULT_GOAL needs a task name");
            }
            doc_.default_goal = value;
            return;
        }

        doc_.variables.push_back(VariableDeclaration{name, parseValue(value), kind, line_});
    }

    void parseRule(const std::string& text, size_t colon) {
        if (colon + 1 < text.size() && text[colon + 1] == ':') {
            fail("double-colon rules are not supported");
        }

        const std::vector<std::string> targets = splitWords(text.substr(0, colon));
        std::string rest = text.substr(colon + 1);
        std::string inline_step;
        const size_t semicolon = rest.find(';');
        if (semicolon != std::string::npos) {
            inline_step = trim(rest.substr(semicolon + 1));
            rest = rest.substr(0, semicolon);
        }
        const std::vector<std::string> prerequisites = splitWords(rest);

        if (targets.empty()) {
            fail("rule without a task name");
        }
        for (const auto& name : prerequisites) {
            if (name.find('$') != std::string::npos || name.find('%') != std::string::npos) {
                fail("prerequisite '" + name + "' must be a plain task name");
            }
        }

        in_rule_ = true;

        if (targets.size() == 1 && targets[0] == ".PHONY") {
            doc_.phony.insert(doc_.phony.end(), prerequisites.begin(), prerequisites.end());
            return;
        }

        for (const auto& name : targets) {
            if (name.find('$') != std::string::npos || name.find('%') != std::string::npos) {
                fail("task name '" + name + "' must be a plain name");
            }
            if (name[0] == '.' && name.size() > 1 && std::isupper(static_cast<unsigned char>(name[1]))) {
                LOG_WARN("taskfile", doc_.source + ":" + std::to_string(line_) +
                         ": special target " + name + " ignored");
                continue;
            }

            TaskDeclaration decl;
            decl.name = name;
            decl.prerequisites = prerequisites;
            decl.line = line_;
            doc_.tasks.push_back(std::move(decl));
            current_.push_back(doc_.tasks.size() - 1);
        }

        if (!inline_step.empty()) {
            parseStep("\t" + inline_step);
        }
    }

    TaskfileDocument doc_;
    size_t line_ = 0;
    bool in_rule_ = false;
    std::vector<size_t> current_;   // EN: Tasks receiving the following steps / FR: Tâches recevant les étapes suivantes
};

} // namespace

TaskfileDocument TaskfileParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TaskfileSyntaxError(path, 0, "cannot open task file");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw TaskfileSyntaxError(path, 0, "error while reading task file");
    }

    return parseString(buffer.str(), path);
}

TaskfileDocument TaskfileParser::parseString(const std::string& content, const std::string& source_name) {
    LineParser parser(source_name);
    TaskfileDocument doc = parser.parse(content);

    LOG_DEBUG_META("taskfile", "Parsed task file", (std::unordered_map<std::string, std::string>{
        {"source", source_name},
        {"tasks", std::to_string(doc.tasks.size())},
        {"variables", std::to_string(doc.variables.size())},
        {"markers", std::to_string(doc.markers.size())}
    }));
    return doc;
}

} // namespace TaskGraph
} // namespace PHR
