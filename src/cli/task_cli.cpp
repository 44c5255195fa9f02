// EN: Task CLI implementation - locate, load, validate, plan, execute, report.
// FR: Implémentation du CLI de tâches - localiser, charger, valider, planifier, exécuter, rapporter.

#include "cli/task_cli.hpp"
#include "cli/help_generator.hpp"
#include "infrastructure/logging/logger.hpp"
#include "taskgraph/variable_resolver.hpp"

#include <cstdlib>
#include <filesystem>
#include <ostream>
#include <system_error>
#include <utility>

namespace PHR {
namespace CLI {

using namespace TaskGraph;

namespace {

const char* const kProgramName = "phonyrun";

template <typename T>
T configOr(const ConfigManager& config, const std::string& key, const T& fallback) {
    return config.has(key) ? config.get(key).asOrDefault<T>(fallback) : fallback;
}

} // namespace

TaskCliConfig TaskCliConfig::fromConfigManager(const ConfigManager& config) {
    TaskCliConfig result;
    result.shell = configOr<std::string>(config, "runner.shell", result.shell);
    result.echo_commands = configOr<bool>(config, "runner.echo_commands", result.echo_commands);
    result.default_task = configOr<std::string>(config, "runner.default_task", result.default_task);
    result.help_task = configOr<std::string>(config, "runner.help_task", result.help_task);
    result.taskfile = configOr<std::string>(config, "runner.taskfile", result.taskfile);
    result.failure_exit_code = configOr<int>(config, "runner.failure_exit_code", result.failure_exit_code);
    result.help_color = configOr<bool>(config, "help.color", result.help_color);
    result.help_name_width = static_cast<size_t>(
        configOr<int>(config, "help.name_width", static_cast<int>(result.help_name_width)));
    result.report_file = configOr<std::string>(config, "report.file", result.report_file);

    if (const char* env_taskfile = std::getenv("PHR_TASKFILE")) {
        if (*env_taskfile != '\0') {
            result.taskfile = env_taskfile;
        }
    }
    return result;
}

std::vector<ConfigManager::ValidationRule> TaskCliConfig::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule rule;
    rule.key = "runner.shell";
    rule.type = "string";
    rules.push_back(rule);

    rule = {};
    rule.key = "runner.echo_commands";
    rule.type = "bool";
    rules.push_back(rule);

    rule = {};
    rule.key = "runner.default_task";
    rule.type = "string";
    rules.push_back(rule);

    rule = {};
    rule.key = "runner.help_task";
    rule.type = "string";
    rules.push_back(rule);

    rule = {};
    rule.key = "runner.taskfile";
    rule.type = "string";
    rules.push_back(rule);

    rule = {};
    rule.key = "runner.failure_exit_code";
    rule.type = "int";
    rule.min_value = 1;
    rule.max_value = 255;
    rule.description = "Exit code for errors other than a failing step";
    rules.push_back(rule);

    rule = {};
    rule.key = "help.color";
    rule.type = "bool";
    rules.push_back(rule);

    rule = {};
    rule.key = "help.name_width";
    rule.type = "int";
    rule.min_value = 1;
    rule.max_value = 80;
    rules.push_back(rule);

    rule = {};
    rule.key = "logging.level";
    rule.type = "string";
    rule.allowed_values = {"DEBUG", "INFO", "WARN", "WARNING", "ERROR"};
    rules.push_back(rule);

    rule = {};
    rule.key = "logging.file";
    rule.type = "string";
    rules.push_back(rule);

    rule = {};
    rule.key = "report.file";
    rule.type = "string";
    rules.push_back(rule);

    return rules;
}

TaskCli::TaskCli(TaskCliConfig config, std::shared_ptr<CommandRunner> runner,
                 std::ostream& out, std::ostream& err)
    : config_(std::move(config)), runner_(std::move(runner)), out_(out), err_(err) {
    if (!runner_) {
        throw std::invalid_argument("TaskCli requires a command runner");
    }
}

const std::vector<std::string>& TaskCli::defaultTaskfileNames() {
    static const std::vector<std::string> names = {
        "Taskfile", "Taskfile.yaml", "Taskfile.yml", "Taskfile.json", "Makefile"
    };
    return names;
}

std::string TaskCli::workingDirectory() const {
    if (!config_.working_directory.empty()) {
        return config_.working_directory;
    }
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        throw CommandLaunchError("getcwd", ec.message());
    }
    return cwd.string();
}

std::string TaskCli::locateTaskfile() const {
    namespace fs = std::filesystem;
    const fs::path base(workingDirectory());

    if (!config_.taskfile.empty()) {
        fs::path explicit_path(config_.taskfile);
        if (explicit_path.is_relative()) {
            explicit_path = base / explicit_path;
        }
        std::error_code ec;
        if (!fs::is_regular_file(explicit_path, ec)) {
            throw TaskfileSyntaxError(config_.taskfile, 0, "task file not found");
        }
        return explicit_path.string();
    }

    std::string tried;
    for (const auto& name : defaultTaskfileNames()) {
        std::error_code ec;
        const fs::path candidate = base / name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
        tried += tried.empty() ? name : ", " + name;
    }
    throw TaskfileSyntaxError(base.string(), 0, "no task file found (looked for " + tried + ")");
}

int TaskCli::run(const std::vector<std::string>& args) {
    RunSummary summary;
    summary.requested = args;
    TaskRunSession session;

    int exit_code = 0;
    try {
        runBatch(args, summary, session);
    } catch (const StepExecutionFailure& e) {
        exit_code = e.exitCode();
        summary.error_message = e.what();
    } catch (const ExecutionInterrupted& e) {
        exit_code = 128 + e.signalNumber();
        summary.error_message = e.what();
    } catch (const TaskRunError& e) {
        exit_code = config_.failure_exit_code;
        summary.error_message = e.what();
        LOG_DEBUG("cli", "Run aborted with " + errorCodeToString(e.code()));
    } catch (const std::exception& e) {
        exit_code = config_.failure_exit_code;
        summary.error_message = e.what();
    }

    if (!summary.error_message.empty()) {
        reportError(summary.error_message);
    }

    summary.exit_code = exit_code;
    if (!config_.report_file.empty()) {
        try {
            writeReport(summary, session);
        } catch (const TaskRunError& e) {
            reportError(e.what());
            if (exit_code == 0) {
                exit_code = config_.failure_exit_code;
            }
        }
    }

    LOG_INFO_META("cli", "Run finished", (std::unordered_map<std::string, std::string>{
        {"exit_code", std::to_string(exit_code)},
        {"duration", TaskUtils::formatDuration(session.getElapsed())}
    }));
    return exit_code;
}

void TaskCli::runBatch(const std::vector<std::string>& args, RunSummary& summary, TaskRunSession& session) {
    const std::string path = locateTaskfile();
    summary.taskfile = path;
    Logger::getInstance().addGlobalMetadata("taskfile", path);

    const TaskfileDocument document = TaskUtils::loadTaskfile(path);

    TaskRegistry registry;
    VariableResolver resolver(runner_);
    resolver.declare("MAKEFILE_LIST", Expression::literal(path));
    resolver.declare("CURDIR", Expression::literal(workingDirectory()));
    document.populate(registry, resolver);
    registry.validateReferences();

    std::vector<std::string> requested = args;
    if (requested.empty()) {
        requested.push_back(document.default_goal ? *document.default_goal : config_.default_task);
    }
    summary.requested = requested;

    const bool builtin_help = !registry.has(config_.help_task);
    std::vector<std::string> roots;
    for (const auto& name : requested) {
        if (builtin_help && name == config_.help_task) {
            continue;
        }
        if (!registry.has(name)) {
            throw UnknownTaskError(name);
        }
        roots.push_back(name);
    }

    DependencyExecutor::Config exec_config;
    exec_config.echo_commands = config_.echo_commands;
    DependencyExecutor executor(registry, resolver, runner_, exec_config, out_);

    // EN: The whole batch is planned before the first step runs.
    // FR: Le lot entier est planifié avant la première étape.
    summary.plan = executor.planBatch(roots);
    session.registerPlan(summary.plan);

    HelpGenerator::Config help_config;
    help_config.color = config_.help_color;
    help_config.name_width = config_.help_name_width;
    const HelpGenerator help(help_config);

    for (const auto& name : requested) {
        if (builtin_help && name == config_.help_task) {
            help.write(registry, out_);
            continue;
        }
        executor.execute(executor.plan(name), session);
    }
}

void TaskCli::reportError(const std::string& message) {
    LOG_ERROR("cli", message);
    err_ << kProgramName << ": *** " << message << std::endl;
}

void TaskCli::writeReport(const RunSummary& summary, const TaskRunSession& session) {
    std::string path = config_.report_file;
    std::filesystem::path report_path(path);
    if (report_path.is_relative()) {
        path = (std::filesystem::path(workingDirectory()) / report_path).string();
    }
    TaskUtils::writeRunReport(path, TaskUtils::buildRunReport(summary, session));
}

} // namespace CLI
} // namespace PHR
