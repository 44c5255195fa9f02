// EN: Task Registry for PhonyRun - named tasks with prerequisites and ordered steps
// FR: Registre de tâches pour PhonyRun - tâches nommées avec prérequis et étapes ordonnées

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "taskgraph/expression.hpp"

namespace PHR {
namespace TaskGraph {

// EN: One shell command of a task. Silent steps are not echoed before running.
// FR: Une commande shell d'une tâche. Les étapes silencieuses ne sont pas affichées avant exécution.
struct TaskStep {
    Expression command;
    bool silent = false;
};

struct TaskDefinition {
    std::string name;
    std::string description;                    // EN: Empty means hidden from the listing / FR: Vide = absente du listing
    std::vector<std::string> prerequisites;     // EN: Declaration order matters / FR: L'ordre de déclaration compte
    std::vector<TaskStep> steps;

    bool isPublic() const { return !description.empty(); }
};

class TaskRegistry {
public:
    // EN: Last declaration wins; a redeclared task keeps its first position.
    // FR: La dernière déclaration gagne ; une tâche redéclarée garde sa première position.
    void declare(TaskDefinition task);

    bool has(const std::string& name) const;

    // EN: Throws UnknownTaskError
    // FR: Lance UnknownTaskError
    const TaskDefinition& lookup(const std::string& name) const;

    // EN: Described tasks, in declaration order
    // FR: Tâches décrites, dans l'ordre de déclaration
    std::vector<const TaskDefinition*> listPublic() const;

    // EN: Every prerequisite must name a declared task; throws UnknownTaskError(name, referenced_by).
    // FR: Chaque prérequis doit nommer une tâche déclarée ; lance UnknownTaskError(nom, référencé_par).
    void validateReferences() const;

    std::vector<std::string> names() const { return order_; }
    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

private:
    std::unordered_map<std::string, TaskDefinition> tasks_;
    std::vector<std::string> order_;
};

} // namespace TaskGraph
} // namespace PHR
