// EN: Command Runner for PhonyRun - one entry point for every external command (steps and $(shell ...))
// FR: Runner de commandes pour PhonyRun - point d'entrée unique pour toute commande externe (étapes et $(shell ...))

#pragma once

#include <string>

namespace PHR {

// EN: What happens to the child's standard output
// FR: Devenir de la sortie standard de l'enfant
enum class CommandOutputMode {
    INHERIT = 0,    // EN: Child writes to our stdout / FR: L'enfant écrit sur notre stdout
    CAPTURE = 1     // EN: Child stdout is collected in the result / FR: La sortie de l'enfant est collectée dans le résultat
};

// EN: Outcome of one external command
// FR: Résultat d'une commande externe
struct CommandResult {
    int exit_code = 0;              // EN: Exit status, or 128 + signal / FR: Code de sortie, ou 128 + signal
    bool signaled = false;
    int signal_number = 0;
    std::string standard_output;    // EN: Only filled in CAPTURE mode / FR: Rempli uniquement en mode CAPTURE

    bool isSuccess() const { return exit_code == 0; }
};

// EN: Abstract command runner, mocked in tests. Implementations throw std::system_error
// EN: when the command cannot be started or waited for.
// FR: Runner de commandes abstrait, simulé dans les tests. Les implémentations lancent std::system_error
// FR: quand la commande ne peut pas être lancée ou attendue.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::string& command, CommandOutputMode mode) = 0;
};

// EN: Runs commands through "<shell> -c <command>", blocking until the child exits.
// FR: Exécute les commandes via "<shell> -c <commande>", en bloquant jusqu'à la fin de l'enfant.
class ShellCommandRunner : public CommandRunner {
public:
    struct Config {
        std::string shell = "/bin/sh";
        bool track_child = true;    // EN: Register the child with SignalHandler / FR: Enregistre l'enfant auprès du SignalHandler
    };

    ShellCommandRunner();
    explicit ShellCommandRunner(Config config);

    CommandResult run(const std::string& command, CommandOutputMode mode) override;

    const Config& getConfig() const { return config_; }

private:
    Config config_;
};

} // namespace PHR
