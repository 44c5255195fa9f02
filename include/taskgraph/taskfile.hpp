// EN: Taskfile document - typed, syntax-free result of loading a task file (line format, YAML or JSON)
// FR: Document Taskfile - résultat typé et sans syntaxe du chargement d'un fichier de tâches (ligne, YAML ou JSON)

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "taskgraph/expression.hpp"
#include "taskgraph/task_registry.hpp"
#include "taskgraph/variable_resolver.hpp"

namespace PHR {
namespace TaskGraph {

enum class AssignmentKind {
    RECURSIVE = 0,      // EN: NAME = value / FR: NOM = valeur
    SIMPLE = 1,         // EN: NAME := value / FR: NOM := valeur
    CONDITIONAL = 2     // EN: NAME ?= value / FR: NOM ?= valeur
};

struct VariableDeclaration {
    std::string name;
    Expression value;
    AssignmentKind kind = AssignmentKind::RECURSIVE;
    size_t line = 0;
};

struct TaskDeclaration {
    std::string name;
    std::string description;
    std::vector<std::string> prerequisites;
    std::vector<TaskStep> steps;
    size_t line = 0;
};

// EN: "#name: text" line, applied to the task by name
// FR: Ligne "#nom: texte", appliquée à la tâche par son nom
struct DescriptionMarker {
    std::string task_name;
    std::string description;
    size_t line = 0;
};

struct TaskfileDocument {
    std::string source;                             // EN: File name, for messages / FR: Nom du fichier, pour les messages
    std::vector<VariableDeclaration> variables;
    std::vector<TaskDeclaration> tasks;             // EN: Duplicates kept in order / FR: Doublons conservés dans l'ordre
    std::vector<DescriptionMarker> markers;
    std::vector<std::string> phony;
    std::optional<std::string> default_goal;

    // EN: Declare variables then tasks. Markers override task descriptions (last one wins);
    // EN: a marker naming no task is ignored with a warning.
    // FR: Déclare les variables puis les tâches. Les marqueurs remplacent les descriptions
    // FR: (le dernier gagne) ; un marqueur sans tâche correspondante est ignoré avec un avertissement.
    void populate(TaskRegistry& registry, VariableResolver& resolver) const;
};

} // namespace TaskGraph
} // namespace PHR
