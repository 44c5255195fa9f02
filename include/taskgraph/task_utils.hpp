// EN: Task utilities - structured task file loaders (YAML, JSON), formatting and the run report
// FR: Utilitaires de tâches - chargeurs de fichiers structurés (YAML, JSON), formatage et rapport d'exécution

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "taskgraph/dependency_executor.hpp"
#include "taskgraph/taskfile.hpp"

namespace PHR {
namespace TaskGraph {

enum class TaskfileFormat {
    LINE = 0,
    YAML = 1,
    JSON = 2
};

// EN: Outcome of one invocation, serialized by buildRunReport
// FR: Résultat d'une invocation, sérialisé par buildRunReport
struct RunSummary {
    std::string taskfile;
    std::vector<std::string> requested;
    ExecutionPlan plan;
    int exit_code = 0;
    std::string error_message;
};

class TaskUtils {
public:
    // EN: ".yaml"/".yml" is YAML, ".json" is JSON, anything else the line format
    // FR: ".yaml"/".yml" pour YAML, ".json" pour JSON, sinon le format ligne
    static TaskfileFormat detectFormat(const std::string& path);
    static std::string formatToString(TaskfileFormat format);

    // EN: Loaders throw TaskfileSyntaxError with the source name (and line when known).
    // FR: Les chargeurs lancent TaskfileSyntaxError avec le nom de la source (et la ligne si connue).
    static TaskfileDocument loadTaskfile(const std::string& path);
    static TaskfileDocument loadTaskfileFromYAML(const std::string& path);
    static TaskfileDocument loadTaskfileFromJSON(const std::string& path);
    static TaskfileDocument parseYAMLTaskfile(const std::string& content, const std::string& source_name = "<yaml>");
    static TaskfileDocument parseJSONTaskfile(const std::string& content, const std::string& source_name = "<json>");

    static std::string formatDuration(std::chrono::milliseconds duration);
    static std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);
    static std::string statusToString(TaskStatus status);

    static nlohmann::json buildRunReport(const RunSummary& summary, const TaskRunSession& session);

    // EN: Throws OutputWriteError when the file cannot be written
    // FR: Lance OutputWriteError si le fichier ne peut être écrit
    static void writeRunReport(const std::string& path, const nlohmann::json& report);
};

} // namespace TaskGraph
} // namespace PHR
