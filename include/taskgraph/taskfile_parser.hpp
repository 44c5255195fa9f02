// EN: Taskfile Parser for PhonyRun - line-oriented task file format
// FR: Parseur de Taskfile pour PhonyRun - format de fichier de tâches orienté ligne

#pragma once

#include <string>

#include "taskgraph/taskfile.hpp"

namespace PHR {
namespace TaskGraph {

// EN: Recognized lines:
// EN:   NAME = value, NAME := value, NAME ?= value
// EN:   name [name...]: prereq ... [; step]
// EN:   <TAB>step, <TAB>@silent-step
// EN:   #name: description
// EN:   .DEFAULT_GOAL = name, .PHONY: names
// EN: A trailing backslash joins the next line. Errors are TaskfileSyntaxError with the line number.
// FR: Lignes reconnues :
// FR:   NOM = valeur, NOM := valeur, NOM ?= valeur
// FR:   nom [nom...]: prérequis ... [; étape]
// FR:   <TAB>étape, <TAB>@étape-silencieuse
// FR:   #nom: description
// FR:   .DEFAULT_GOAL = nom, .PHONY: noms
// FR: Un antislash final joint la ligne suivante. Les erreurs sont des TaskfileSyntaxError avec le numéro de ligne.
class TaskfileParser {
public:
    static TaskfileDocument parseFile(const std::string& path);
    static TaskfileDocument parseString(const std::string& content,
                                        const std::string& source_name = "<string>");
};

} // namespace TaskGraph
} // namespace PHR
