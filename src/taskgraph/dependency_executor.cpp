// EN: Plan building (depth-first, visited / in-progress marks) and sequential execution.
// FR: Construction du plan (profondeur d'abord, marques visité / en cours) et exécution séquentielle.

#include "taskgraph/dependency_executor.hpp"
#include "taskgraph/task_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace PHR {
namespace TaskGraph {

bool ExecutionPlan::contains(const std::string& task_name) const {
    return std::find(order.begin(), order.end(), task_name) != order.end();
}

// EN: TaskRunSession implementation
// FR: Implémentation de TaskRunSession
TaskRunSession::TaskRunSession() : start_time_(std::chrono::system_clock::now()) {}

void TaskRunSession::registerPlan(const ExecutionPlan& plan) {
    for (const auto& name : plan.order) {
        resultFor(name);
    }
}

TaskResult& TaskRunSession::resultFor(const std::string& task_name) {
    auto it = results_.find(task_name);
    if (it == results_.end()) {
        order_.push_back(task_name);
        TaskResult result;
        result.task_name = task_name;
        it = results_.emplace(task_name, std::move(result)).first;
    }
    return it->second;
}

void TaskRunSession::markStarted(const std::string& task_name) {
    resultFor(task_name).status = TaskStatus::RUNNING;
    started_at_[task_name] = std::chrono::steady_clock::now();
}

void TaskRunSession::recordStepRun(const std::string& task_name) {
    ++resultFor(task_name).steps_run;
}

void TaskRunSession::markCompleted(const std::string& task_name) {
    TaskResult& result = resultFor(task_name);
    result.status = TaskStatus::COMPLETED;
    auto started = started_at_.find(task_name);
    if (started != started_at_.end()) {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started->second);
    }
    completed_.insert(task_name);
}

void TaskRunSession::markFailed(const std::string& task_name, TaskStatus status, int exit_code,
                                const std::string& command, const std::string& message) {
    TaskResult& result = resultFor(task_name);
    result.status = status;
    result.exit_code = exit_code;
    result.failed_command = command;
    result.error_message = message;
    auto started = started_at_.find(task_name);
    if (started != started_at_.end()) {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started->second);
    }
}

bool TaskRunSession::isCompleted(const std::string& task_name) const {
    return completed_.count(task_name) > 0;
}

std::optional<TaskResult> TaskRunSession::getResult(const std::string& task_name) const {
    auto it = results_.find(task_name);
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TaskResult> TaskRunSession::getAllResults() const {
    std::vector<TaskResult> results;
    results.reserve(order_.size());
    for (const auto& name : order_) {
        results.push_back(results_.at(name));
    }
    return results;
}

std::chrono::milliseconds TaskRunSession::getElapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);
}

// EN: DependencyExecutor implementation
// FR: Implémentation de DependencyExecutor
DependencyExecutor::DependencyExecutor(const TaskRegistry& registry, VariableResolver& resolver,
                                       std::shared_ptr<CommandRunner> runner)
    : DependencyExecutor(registry, resolver, std::move(runner), Config{}, std::cout) {}

DependencyExecutor::DependencyExecutor(const TaskRegistry& registry, VariableResolver& resolver,
                                       std::shared_ptr<CommandRunner> runner, Config config,
                                       std::ostream& echo_stream)
    : registry_(registry),
      resolver_(resolver),
      runner_(std::move(runner)),
      config_(config),
      echo_stream_(echo_stream) {
    if (!runner_) {
        throw std::invalid_argument("DependencyExecutor requires a command runner");
    }
}

ExecutionPlan DependencyExecutor::plan(const std::string& root) const {
    return planBatch({root});
}

ExecutionPlan DependencyExecutor::planBatch(const std::vector<std::string>& roots) const {
    ExecutionPlan result;
    result.roots = roots;

    std::set<std::string> visited;
    std::vector<std::string> in_progress;
    for (const auto& root : roots) {
        visit(root, visited, in_progress, result.order);
    }

    LOG_DEBUG_META("executor", "Execution plan built", (std::unordered_map<std::string, std::string>{
        {"roots", std::to_string(roots.size())},
        {"tasks", std::to_string(result.order.size())}
    }));
    return result;
}

void DependencyExecutor::visit(const std::string& task_name, std::set<std::string>& visited,
                               std::vector<std::string>& in_progress,
                               std::vector<std::string>& order) const {
    if (visited.count(task_name) > 0) {
        return;
    }

    auto back_edge = std::find(in_progress.begin(), in_progress.end(), task_name);
    if (back_edge != in_progress.end()) {
        std::vector<std::string> cycle(back_edge, in_progress.end());
        cycle.push_back(task_name);
        throw CyclicDependencyError(std::move(cycle));
    }

    const TaskDefinition& task = registry_.lookup(task_name);

    in_progress.push_back(task_name);
    for (const auto& prereq : task.prerequisites) {
        visit(prereq, visited, in_progress, order);
    }
    in_progress.pop_back();

    visited.insert(task_name);
    order.push_back(task_name);
}

void DependencyExecutor::execute(const ExecutionPlan& plan) {
    TaskRunSession session;
    execute(plan, session);
}

void DependencyExecutor::execute(const ExecutionPlan& plan, TaskRunSession& session) {
    session.registerPlan(plan);

    for (const auto& name : plan.order) {
        if (session.isCompleted(name)) {
            continue;
        }
        runTask(registry_.lookup(name), session);
    }
}

void DependencyExecutor::checkInterrupt() const {
    auto& signals = SignalHandler::getInstance();
    if (signals.isShutdownRequested()) {
        throw ExecutionInterrupted(signals.getReceivedSignal());
    }
}

void DependencyExecutor::runTask(const TaskDefinition& task, TaskRunSession& session) {
    session.markStarted(task.name);
    LOG_INFO("executor", "Running task " + task.name);

    // EN: Interpolate every step first so variable errors surface before anything runs.
    // FR: Interpoler toutes les étapes d'abord pour que les erreurs de variables sortent avant toute exécution.
    std::vector<std::string> commands;
    commands.reserve(task.steps.size());
    try {
        for (const auto& step : task.steps) {
            commands.push_back(resolver_.interpolate(step.command));
        }
    } catch (const ExecutionInterrupted& e) {
        session.markFailed(task.name, TaskStatus::INTERRUPTED, 128 + e.signalNumber(), "", e.what());
        throw;
    } catch (const VariableExtractionError& e) {
        if (!e.variableName().empty()) {
            session.markFailed(task.name, TaskStatus::FAILED, 0, "", e.what());
            throw;
        }
        VariableExtractionError inline_error("", e.command(), e.exitCode(), task.name);
        session.markFailed(task.name, TaskStatus::FAILED, 0, "", inline_error.what());
        throw inline_error;
    } catch (const TaskRunError& e) {
        session.markFailed(task.name, TaskStatus::FAILED, 0, "", e.what());
        throw;
    }

    for (size_t i = 0; i < task.steps.size(); ++i) {
        const std::string& command = commands[i];

        try {
            checkInterrupt();
        } catch (const ExecutionInterrupted& e) {
            session.markFailed(task.name, TaskStatus::INTERRUPTED, 128 + e.signalNumber(), command, e.what());
            throw;
        }

        if (config_.echo_commands && !task.steps[i].silent) {
            echo_stream_ << command << '\n';
            echo_stream_.flush();
            if (!echo_stream_) {
                LOG_WARN("executor", "Could not echo command for task " + task.name);
            }
        }

        CommandResult result;
        try {
            result = runner_->run(command, CommandOutputMode::INHERIT);
        } catch (const std::system_error& e) {
            CommandLaunchError error(command, e.what());
            session.markFailed(task.name, TaskStatus::FAILED, 0, command, error.what());
            throw error;
        }
        session.recordStepRun(task.name);

        if (result.isSuccess()) {
            continue;
        }

        auto& signals = SignalHandler::getInstance();
        if (signals.isShutdownRequested()) {
            ExecutionInterrupted error(signals.getReceivedSignal());
            session.markFailed(task.name, TaskStatus::INTERRUPTED, 128 + error.signalNumber(),
                               command, error.what());
            throw error;
        }

        StepExecutionFailure failure(task.name, i + 1, command, result.exit_code);
        LOG_ERROR_META("executor", "Step failed", (std::unordered_map<std::string, std::string>{
            {"task", task.name},
            {"step", std::to_string(i + 1)},
            {"exit_code", std::to_string(result.exit_code)}
        }));
        session.markFailed(task.name, TaskStatus::FAILED, result.exit_code, command, failure.what());
        throw failure;
    }

    session.markCompleted(task.name);
    LOG_INFO("executor", "Task " + task.name + " completed");
}

} // namespace TaskGraph
} // namespace PHR
