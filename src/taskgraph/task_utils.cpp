// EN: Task utilities implementation - YAML via yaml-cpp, JSON via nlohmann::json
// FR: Implémentation des utilitaires de tâches - YAML via yaml-cpp, JSON via nlohmann::json

#include "taskgraph/task_utils.hpp"
#include "taskgraph/task_errors.hpp"
#include "taskgraph/taskfile_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace PHR {
namespace TaskGraph {

namespace {

std::string lowerExtension(const std::string& path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string readWholeFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TaskfileSyntaxError(path, 0, "cannot open task file");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw TaskfileSyntaxError(path, 0, "error while reading task file");
    }
    return buffer.str();
}

Expression parseValueAt(const std::string& text, const std::string& source, size_t line) {
    try {
        return parseExpression(text);
    } catch (const TaskfileSyntaxError& e) {
        throw TaskfileSyntaxError(source, line, e.detail());
    }
}

// EN: YAML document walker; every node error carries its 1-based line.
// FR: Parcours du document YAML ; chaque erreur de nœud porte sa ligne (base 1).
class YamlTaskfileReader {
public:
    explicit YamlTaskfileReader(const std::string& source) : source_(source) {}

    TaskfileDocument read(const YAML::Node& root) {
        TaskfileDocument doc;
        doc.source = source_;

        if (!root || root.IsNull()) {
            return doc;
        }
        if (!root.IsMap()) {
            fail(root, "top level must be a mapping");
        }

        if (const YAML::Node def = root["default"]) {
            doc.default_goal = scalar(def, "default");
        }

        if (const YAML::Node vars = root["variables"]) {
            if (!vars.IsMap()) {
                fail(vars, "'variables' must be a mapping");
            }
            for (const auto& entry : vars) {
                VariableDeclaration decl;
                decl.name = scalar(entry.first, "variable name");
                decl.line = lineOf(entry.second);
                decl.value = parseValueAt(entry.second.IsNull() ? std::string() : scalar(entry.second, decl.name),
                                          source_, decl.line);
                doc.variables.push_back(std::move(decl));
            }
        }

        if (const YAML::Node tasks = root["tasks"]) {
            if (!tasks.IsSequence()) {
                fail(tasks, "'tasks' must be a sequence");
            }
            for (const auto& node : tasks) {
                doc.tasks.push_back(readTask(node));
            }
        }

        return doc;
    }

private:
    [[noreturn]] void fail(const YAML::Node& node, const std::string& detail) const {
        throw TaskfileSyntaxError(source_, lineOf(node), detail);
    }

    static size_t lineOf(const YAML::Node& node) {
        const YAML::Mark mark = node.Mark();
        return mark.line >= 0 ? static_cast<size_t>(mark.line) + 1 : 0;
    }

    std::string scalar(const YAML::Node& node, const std::string& what) const {
        if (!node.IsScalar()) {
            fail(node, "'" + what + "' must be a scalar");
        }
        return node.Scalar();
    }

    std::vector<std::string> nameList(const YAML::Node& node, const std::string& what) const {
        std::vector<std::string> names;
        if (node.IsScalar()) {
            names.push_back(node.Scalar());
        } else if (node.IsSequence()) {
            for (const auto& item : node) {
                names.push_back(scalar(item, what));
            }
        } else if (!node.IsNull()) {
            fail(node, "'" + what + "' must be a name or a list of names");
        }
        return names;
    }

    TaskDeclaration readTask(const YAML::Node& node) const {
        if (!node.IsMap()) {
            fail(node, "task entry must be a mapping");
        }

        TaskDeclaration decl;
        decl.line = lineOf(node);

        const YAML::Node name = node["name"];
        if (!name) {
            fail(node, "task entry without 'name'");
        }
        decl.name = scalar(name, "name");
        if (decl.name.empty()) {
            fail(name, "task name cannot be empty");
        }

        if (const YAML::Node desc = node["description"]) {
            decl.description = scalar(desc, "description");
        }
        if (const YAML::Node prereqs = node["prerequisites"]) {
            decl.prerequisites = nameList(prereqs, "prerequisites");
        }
        if (const YAML::Node steps = node["steps"]) {
            if (!steps.IsSequence()) {
                fail(steps, "'steps' of task '" + decl.name + "' must be a sequence");
            }
            for (const auto& step : steps) {
                decl.steps.push_back(readStep(step));
            }
        }
        return decl;
    }

    TaskStep readStep(const YAML::Node& node) const {
        TaskStep step;
        if (node.IsScalar()) {
            step.command = parseValueAt(node.Scalar(), source_, lineOf(node));
            return step;
        }
        if (!node.IsMap() || !node["command"]) {
            fail(node, "step must be a command string or a mapping with 'command'");
        }
        step.command = parseValueAt(scalar(node["command"], "command"), source_, lineOf(node));
        if (const YAML::Node silent = node["silent"]) {
            bool value = false;
            if (!YAML::convert<bool>::decode(silent, value)) {
                fail(silent, "'silent' must be a boolean");
            }
            step.silent = value;
        }
        return step;
    }

    std::string source_;
};

class JsonTaskfileReader {
public:
    explicit JsonTaskfileReader(const std::string& source) : source_(source) {}

    TaskfileDocument read(const nlohmann::json& root) {
        TaskfileDocument doc;
        doc.source = source_;

        if (!root.is_object()) {
            fail("top level must be an object");
        }

        if (root.contains("default")) {
            doc.default_goal = textOf(root.at("default"), "default");
        }

        if (root.contains("variables")) {
            const auto& vars = root.at("variables");
            if (!vars.is_object()) {
                fail("'variables' must be an object");
            }
            for (auto it = vars.begin(); it != vars.end(); ++it) {
                VariableDeclaration decl;
                decl.name = it.key();
                decl.value = parseValueAt(it.value().is_null() ? std::string() : textOf(it.value(), it.key()),
                                          source_, 0);
                doc.variables.push_back(std::move(decl));
            }
        }

        if (root.contains("tasks")) {
            const auto& tasks = root.at("tasks");
            if (!tasks.is_array()) {
                fail("'tasks' must be an array");
            }
            for (const auto& entry : tasks) {
                doc.tasks.push_back(readTask(entry));
            }
        }

        return doc;
    }

private:
    [[noreturn]] void fail(const std::string& detail) const {
        throw TaskfileSyntaxError(source_, 0, detail);
    }

    std::string textOf(const nlohmann::json& value, const std::string& what) const {
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_number() || value.is_boolean()) {
            return value.dump();
        }
        fail("'" + what + "' must be a string");
    }

    TaskDeclaration readTask(const nlohmann::json& entry) const {
        if (!entry.is_object()) {
            fail("task entry must be an object");
        }
        if (!entry.contains("name")) {
            fail("task entry without 'name'");
        }

        TaskDeclaration decl;
        decl.name = textOf(entry.at("name"), "name");
        if (decl.name.empty()) {
            fail("task name cannot be empty");
        }
        if (entry.contains("description")) {
            decl.description = textOf(entry.at("description"), "description");
        }
        if (entry.contains("prerequisites")) {
            const auto& prereqs = entry.at("prerequisites");
            if (prereqs.is_string()) {
                decl.prerequisites.push_back(prereqs.get<std::string>());
            } else if (prereqs.is_array()) {
                for (const auto& name : prereqs) {
                    decl.prerequisites.push_back(textOf(name, "prerequisites"));
                }
            } else if (!prereqs.is_null()) {
                fail("'prerequisites' of task '" + decl.name + "' must be a string or an array");
            }
        }
        if (entry.contains("steps")) {
            const auto& steps = entry.at("steps");
            if (!steps.is_array()) {
                fail("'steps' of task '" + decl.name + "' must be an array");
            }
            for (const auto& step : steps) {
                decl.steps.push_back(readStep(step, decl.name));
            }
        }
        return decl;
    }

    TaskStep readStep(const nlohmann::json& value, const std::string& task_name) const {
        TaskStep step;
        if (value.is_string()) {
            step.command = parseValueAt(value.get<std::string>(), source_, 0);
            return step;
        }
        if (!value.is_object() || !value.contains("command")) {
            fail("step of task '" + task_name + "' must be a string or an object with 'command'");
        }
        step.command = parseValueAt(textOf(value.at("command"), "command"), source_, 0);
        if (value.contains("silent")) {
            if (!value.at("silent").is_boolean()) {
                fail("'silent' of task '" + task_name + "' must be a boolean");
            }
            step.silent = value.at("silent").get<bool>();
        }
        return step;
    }

    std::string source_;
};

} // namespace

TaskfileFormat TaskUtils::detectFormat(const std::string& path) {
    const std::string ext = lowerExtension(path);
    if (ext == ".yaml" || ext == ".yml") {
        return TaskfileFormat::YAML;
    }
    if (ext == ".json") {
        return TaskfileFormat::JSON;
    }
    return TaskfileFormat::LINE;
}

std::string TaskUtils::formatToString(TaskfileFormat format) {
    switch (format) {
        case TaskfileFormat::LINE: return "line";
        case TaskfileFormat::YAML: return "yaml";
        case TaskfileFormat::JSON: return "json";
        default: return "unknown";
    }
}

TaskfileDocument TaskUtils::loadTaskfile(const std::string& path) {
    const TaskfileFormat format = detectFormat(path);
    LOG_DEBUG("taskfile", "Loading " + path + " as " + formatToString(format));

    switch (format) {
        case TaskfileFormat::YAML: return loadTaskfileFromYAML(path);
        case TaskfileFormat::JSON: return loadTaskfileFromJSON(path);
        case TaskfileFormat::LINE:
        default: return TaskfileParser::parseFile(path);
    }
}

TaskfileDocument TaskUtils::loadTaskfileFromYAML(const std::string& path) {
    return parseYAMLTaskfile(readWholeFile(path), path);
}

TaskfileDocument TaskUtils::loadTaskfileFromJSON(const std::string& path) {
    return parseJSONTaskfile(readWholeFile(path), path);
}

TaskfileDocument TaskUtils::parseYAMLTaskfile(const std::string& content, const std::string& source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::ParserException& e) {
        throw TaskfileSyntaxError(source_name, static_cast<size_t>(e.mark.line + 1), e.msg);
    }

    YamlTaskfileReader reader(source_name);
    return reader.read(root);
}

TaskfileDocument TaskUtils::parseJSONTaskfile(const std::string& content, const std::string& source_name) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw TaskfileSyntaxError(source_name, 0, e.what());
    }

    JsonTaskfileReader reader(source_name);
    return reader.read(root);
}

std::string TaskUtils::formatDuration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (static_cast<double>(ms) / 1000.0) << "s";
    return oss.str();
}

std::string TaskUtils::formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    const auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string TaskUtils::statusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::RUNNING: return "RUNNING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        case TaskStatus::INTERRUPTED: return "INTERRUPTED";
        default: return "UNKNOWN";
    }
}

nlohmann::json TaskUtils::buildRunReport(const RunSummary& summary, const TaskRunSession& session) {
    nlohmann::json report;
    report["taskfile"] = summary.taskfile;
    report["requested"] = summary.requested;
    report["plan"] = summary.plan.order;
    report["started_at"] = formatTimestamp(session.getStartTime());
    report["duration_ms"] = session.getElapsed().count();
    report["exit_code"] = summary.exit_code;
    report["success"] = summary.exit_code == 0;
    if (summary.error_message.empty()) {
        report["error"] = nullptr;
    } else {
        report["error"] = summary.error_message;
    }

    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& result : session.getAllResults()) {
        nlohmann::json entry;
        entry["name"] = result.task_name;
        entry["status"] = statusToString(result.status);
        entry["steps_run"] = result.steps_run;
        entry["duration_ms"] = result.duration.count();
        entry["exit_code"] = result.exit_code;
        if (!result.failed_command.empty()) {
            entry["failed_command"] = result.failed_command;
        }
        if (!result.error_message.empty()) {
            entry["error"] = result.error_message;
        }
        tasks.push_back(std::move(entry));
    }
    report["tasks"] = std::move(tasks);
    return report;
}

void TaskUtils::writeRunReport(const std::string& path, const nlohmann::json& report) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw OutputWriteError("Cannot open report file '" + path + "'");
    }
    file << report.dump(2) << '\n';
    file.flush();
    if (!file) {
        throw OutputWriteError("Cannot write report file '" + path + "'");
    }
    LOG_INFO("report", "Run report written to " + path);
}

} // namespace TaskGraph
} // namespace PHR
