// EN: Task CLI for PhonyRun - turns "phonyrun [task ...]" into a planned, executed batch and an exit code
// FR: CLI de tâches pour PhonyRun - transforme "phonyrun [tâche ...]" en lot planifié, exécuté, et en code de sortie

#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/system/command_runner.hpp"
#include "taskgraph/dependency_executor.hpp"
#include "taskgraph/task_errors.hpp"
#include "taskgraph/task_utils.hpp"

namespace PHR {
namespace CLI {

// EN: Front-end settings, read from the "runner", "help" and "report" sections
// FR: Réglages du front-end, lus dans les sections "runner", "help" et "report"
struct TaskCliConfig {
    std::string shell = "/bin/sh";
    bool echo_commands = true;
    std::string default_task = "help";
    std::string help_task = "help";
    std::string taskfile;               // EN: Empty means search the defaults / FR: Vide = recherche des noms par défaut
    int failure_exit_code = 2;
    bool help_color = true;
    size_t help_name_width = 20;
    std::string report_file;
    std::string working_directory;      // EN: Empty means the process cwd / FR: Vide = répertoire courant du processus

    // EN: PHR_TASKFILE in the environment wins over runner.taskfile
    // FR: PHR_TASKFILE dans l'environnement prime sur runner.taskfile
    static TaskCliConfig fromConfigManager(const ConfigManager& config);

    static std::vector<ConfigManager::ValidationRule> validationRules();
};

class TaskCli {
public:
    TaskCli(TaskCliConfig config, std::shared_ptr<CommandRunner> runner,
            std::ostream& out, std::ostream& err);

    // EN: Never throws for engine errors: they are printed and mapped to the exit code.
    // FR: Ne lance jamais pour les erreurs du moteur : elles sont affichées et traduites en code de sortie.
    int run(const std::vector<std::string>& args);

    // EN: Throws TaskfileSyntaxError when no task file can be found
    // FR: Lance TaskfileSyntaxError si aucun fichier de tâches n'est trouvé
    std::string locateTaskfile() const;

    static const std::vector<std::string>& defaultTaskfileNames();

    const TaskCliConfig& getConfig() const { return config_; }

private:
    void runBatch(const std::vector<std::string>& args, TaskGraph::RunSummary& summary,
                  TaskGraph::TaskRunSession& session);
    void reportError(const std::string& message);
    void writeReport(const TaskGraph::RunSummary& summary, const TaskGraph::TaskRunSession& session);
    std::string workingDirectory() const;

    TaskCliConfig config_;
    std::shared_ptr<CommandRunner> runner_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace CLI
} // namespace PHR
