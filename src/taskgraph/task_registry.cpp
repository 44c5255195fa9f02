#include "taskgraph/task_registry.hpp"
#include "taskgraph/task_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>
#include <utility>

namespace PHR {
namespace TaskGraph {

void TaskRegistry::declare(TaskDefinition task) {
    if (task.name.empty()) {
        throw std::invalid_argument("Task name cannot be empty");
    }

    auto existing = tasks_.find(task.name);
    if (existing != tasks_.end()) {
        LOG_DEBUG("registry", "Task '" + task.name + "' redeclared, previous definition replaced");
        existing->second = std::move(task);
        return;
    }

    order_.push_back(task.name);
    const std::string name = task.name;
    tasks_.emplace(name, std::move(task));
}

bool TaskRegistry::has(const std::string& name) const {
    return tasks_.find(name) != tasks_.end();
}

const TaskDefinition& TaskRegistry::lookup(const std::string& name) const {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        throw UnknownTaskError(name);
    }
    return it->second;
}

std::vector<const TaskDefinition*> TaskRegistry::listPublic() const {
    std::vector<const TaskDefinition*> result;
    for (const auto& name : order_) {
        const auto& task = tasks_.at(name);
        if (task.isPublic()) {
            result.push_back(&task);
        }
    }
    return result;
}

void TaskRegistry::validateReferences() const {
    for (const auto& name : order_) {
        for (const auto& prereq : tasks_.at(name).prerequisites) {
            if (!has(prereq)) {
                throw UnknownTaskError(prereq, name);
            }
        }
    }
}

} // namespace TaskGraph
} // namespace PHR
