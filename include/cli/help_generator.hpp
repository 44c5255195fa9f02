// EN: Help Generator for PhonyRun - two-column listing of documented tasks
// FR: Générateur d'aide pour PhonyRun - listing en deux colonnes des tâches documentées

#pragma once

#include <iosfwd>
#include <string>

#include "taskgraph/task_registry.hpp"

namespace PHR {
namespace CLI {

class HelpGenerator {
public:
    struct Config {
        bool color = true;          // EN: Cyan task names / FR: Noms de tâches en cyan
        size_t name_width = 20;     // EN: Name column width / FR: Largeur de la colonne des noms
    };

    HelpGenerator();
    explicit HelpGenerator(Config config);

    // EN: One line per described task, in declaration order. Throws OutputWriteError.
    // FR: Une ligne par tâche décrite, dans l'ordre de déclaration. Lance OutputWriteError.
    void write(const TaskGraph::TaskRegistry& registry, std::ostream& out) const;

    std::string formatRow(const std::string& name, const std::string& description) const;

private:
    Config config_;
};

} // namespace CLI
} // namespace PHR
