// EN: Dependency Executor for PhonyRun - plans prerequisite order and runs task steps fail-fast
// FR: Exécuteur de dépendances pour PhonyRun - planifie l'ordre des prérequis et exécute les étapes en fail-fast

#pragma once

#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "taskgraph/task_registry.hpp"
#include "taskgraph/variable_resolver.hpp"

namespace PHR {
namespace TaskGraph {

// EN: Status of a task within a run
// FR: Statut d'une tâche au sein d'une exécution
enum class TaskStatus {
    PENDING = 0,        // EN: Planned, not started / FR: Planifiée, pas commencée
    RUNNING = 1,        // EN: Steps in progress / FR: Étapes en cours
    COMPLETED = 2,      // EN: Every step exited 0 / FR: Toutes les étapes ont retourné 0
    FAILED = 3,         // EN: A step failed or could not be prepared / FR: Une étape a échoué ou n'a pu être préparée
    INTERRUPTED = 4     // EN: Stopped by a signal / FR: Arrêtée par un signal
};

struct TaskResult {
    std::string task_name;
    TaskStatus status = TaskStatus::PENDING;
    size_t steps_run = 0;
    std::chrono::milliseconds duration{0};
    int exit_code = 0;
    std::string failed_command;
    std::string error_message;
};

// EN: Linear order in which tasks run; prerequisites always come first, no task twice.
// FR: Ordre linéaire d'exécution ; les prérequis viennent toujours avant, aucune tâche en double.
struct ExecutionPlan {
    std::vector<std::string> roots;
    std::vector<std::string> order;

    bool contains(const std::string& task_name) const;
    size_t size() const { return order.size(); }
    bool empty() const { return order.empty(); }
};

// EN: State of one invocation: per-task results and the set of tasks already completed.
// FR: État d'une invocation : résultats par tâche et ensemble des tâches déjà terminées.
class TaskRunSession {
public:
    TaskRunSession();

    void registerPlan(const ExecutionPlan& plan);

    void markStarted(const std::string& task_name);
    void recordStepRun(const std::string& task_name);
    void markCompleted(const std::string& task_name);
    void markFailed(const std::string& task_name, TaskStatus status, int exit_code,
                    const std::string& command, const std::string& message);

    bool isCompleted(const std::string& task_name) const;
    const std::set<std::string>& getCompletedTasks() const { return completed_; }

    std::optional<TaskResult> getResult(const std::string& task_name) const;
    std::vector<TaskResult> getAllResults() const;  // EN: Plan order / FR: Ordre du plan

    std::chrono::system_clock::time_point getStartTime() const { return start_time_; }
    std::chrono::milliseconds getElapsed() const;

private:
    TaskResult& resultFor(const std::string& task_name);

    std::chrono::system_clock::time_point start_time_;
    std::unordered_map<std::string, TaskResult> results_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> started_at_;
    std::vector<std::string> order_;
    std::set<std::string> completed_;
};

class DependencyExecutor {
public:
    struct Config {
        bool echo_commands = true;      // EN: Print non-silent steps before running / FR: Affiche les étapes non silencieuses
    };

    DependencyExecutor(const TaskRegistry& registry, VariableResolver& resolver,
                       std::shared_ptr<CommandRunner> runner);
    DependencyExecutor(const TaskRegistry& registry, VariableResolver& resolver,
                       std::shared_ptr<CommandRunner> runner, Config config, std::ostream& echo_stream);

    // EN: Depth-first plan; throws UnknownTaskError or CyclicDependencyError. Never runs anything.
    // FR: Plan en profondeur ; lance UnknownTaskError ou CyclicDependencyError. N'exécute rien.
    ExecutionPlan plan(const std::string& root) const;
    ExecutionPlan planBatch(const std::vector<std::string>& roots) const;

    // EN: Runs the plan in order; the first failing step aborts the whole run with StepExecutionFailure.
    // FR: Exécute le plan dans l'ordre ; la première étape en échec arrête tout avec StepExecutionFailure.
    void execute(const ExecutionPlan& plan, TaskRunSession& session);
    void execute(const ExecutionPlan& plan);

private:
    void visit(const std::string& task_name, std::set<std::string>& visited,
               std::vector<std::string>& in_progress, std::vector<std::string>& order) const;
    void runTask(const TaskDefinition& task, TaskRunSession& session);
    void checkInterrupt() const;

    const TaskRegistry& registry_;
    VariableResolver& resolver_;
    std::shared_ptr<CommandRunner> runner_;
    Config config_;
    std::ostream& echo_stream_;
};

} // namespace TaskGraph
} // namespace PHR
