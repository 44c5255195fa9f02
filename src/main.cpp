// EN: Entry point of phonyrun. Loads configuration, sets up logging and signals, runs the requested tasks.
// FR: Point d'entrée de phonyrun. Charge la configuration, prépare les logs et les signaux, exécute les tâches demandées.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/task_cli.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/signal_handler.hpp"

namespace {

const char* const kDefaultConfigFile = ".phonyrun.yaml";

// EN: Returns false (after printing why) when the configuration cannot be used.
// FR: Retourne false (après en avoir affiché la raison) si la configuration est inutilisable.
bool loadConfiguration(PHR::ConfigManager& config) {
    std::string path;
    bool explicit_path = false;
    if (const char* env_path = std::getenv("PHR_CONFIG")) {
        path = env_path;
        explicit_path = !path.empty();
    }
    if (path.empty()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(kDefaultConfigFile, ec)) {
            path = kDefaultConfigFile;
        }
    }

    if (!path.empty() && !config.loadFromFile(path)) {
        std::cerr << "phonyrun: *** Cannot load configuration file '" << path << "'" << std::endl;
        return false;
    }
    if (explicit_path) {
        PHR::Logger::getInstance().addGlobalMetadata("config", path);
    }

    config.loadEnvironmentOverrides("PHR_");
    config.addValidationRules(PHR::CLI::TaskCliConfig::validationRules());

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "phonyrun: *** " << error << std::endl;
        }
        return false;
    }
    return true;
}

// EN: Returns false when the log file cannot be opened.
// FR: Retourne false si le fichier de log ne peut être ouvert.
bool setupLogging(const PHR::ConfigManager& config) {
    auto& logger = PHR::Logger::getInstance();

    const std::string level_name = config.get("logging.level").asOrDefault<std::string>("WARN");
    logger.setLogLevel(PHR::Logger::levelFromString(level_name).value_or(PHR::LogLevel::WARN));

    const std::string log_file = config.get("logging.file").asOrDefault<std::string>("");
    if (!log_file.empty() && !logger.setOutputFile(log_file)) {
        std::cerr << "phonyrun: *** Cannot open log file '" << log_file << "'" << std::endl;
        return false;
    }

    logger.setCorrelationId(logger.generateCorrelationId());
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& config = PHR::ConfigManager::getInstance();
    const PHR::CLI::TaskCliConfig defaults;

    if (!loadConfiguration(config)) {
        return defaults.failure_exit_code;
    }

    PHR::CLI::TaskCliConfig cli_config = PHR::CLI::TaskCliConfig::fromConfigManager(config);
    if (!setupLogging(config)) {
        return cli_config.failure_exit_code;
    }

    auto& signals = PHR::SignalHandler::getInstance();
    try {
        signals.initialize();
    } catch (const std::exception& e) {
        std::cerr << "phonyrun: *** " << e.what() << std::endl;
        return cli_config.failure_exit_code;
    }
    signals.registerCleanupCallback("logger", [] {
        PHR::Logger::getInstance().flush();
    });

    PHR::ShellCommandRunner::Config runner_config;
    runner_config.shell = cli_config.shell;
    auto runner = std::make_shared<PHR::ShellCommandRunner>(runner_config);

    std::vector<std::string> args(argv + 1, argv + argc);
    PHR::CLI::TaskCli cli(std::move(cli_config), runner, std::cout, std::cerr);
    const int exit_code = cli.run(args);

    signals.executeCleanup();
    return exit_code;
}
