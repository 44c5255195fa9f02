#include "taskgraph/taskfile.hpp"
#include "infrastructure/logging/logger.hpp"

#include <unordered_map>
#include <unordered_set>

namespace PHR {
namespace TaskGraph {

void TaskfileDocument::populate(TaskRegistry& registry, VariableResolver& resolver) const {
    for (const auto& var : variables) {
        if (var.kind == AssignmentKind::CONDITIONAL) {
            resolver.declareIfAbsent(var.name, var.value);
        } else {
            resolver.declare(var.name, var.value);
        }
    }

    std::unordered_map<std::string, std::string> marker_text;
    for (const auto& marker : markers) {
        marker_text[marker.task_name] = marker.description;
    }

    std::unordered_set<std::string> declared;
    for (const auto& decl : tasks) {
        TaskDefinition task;
        task.name = decl.name;
        task.description = decl.description;
        task.prerequisites = decl.prerequisites;
        task.steps = decl.steps;

        auto marker = marker_text.find(decl.name);
        if (marker != marker_text.end()) {
            task.description = marker->second;
        }

        declared.insert(decl.name);
        registry.declare(std::move(task));
    }

    for (const auto& marker : markers) {
        if (declared.find(marker.task_name) == declared.end()) {
            LOG_WARN_META("taskfile", "Description for undeclared task ignored",
                          (std::unordered_map<std::string, std::string>{
                              {"task", marker.task_name},
                              {"source", source},
                              {"line", std::to_string(marker.line)}
                          }));
        }
    }

    LOG_INFO("taskfile", "Loaded " + std::to_string(registry.size()) + " tasks and " +
             std::to_string(resolver.names().size()) + " variables from " + source);
}

} // namespace TaskGraph
} // namespace PHR
