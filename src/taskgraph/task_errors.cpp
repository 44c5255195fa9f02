// EN: Error message construction for the task graph engine.
// FR: Construction des messages d'erreur du moteur de graphe de tâches.

#include "taskgraph/task_errors.hpp"

#include <cstring>
#include <utility>

namespace PHR {
namespace TaskGraph {

namespace {

std::string joinChain(const std::vector<std::string>& names) {
    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) result += " -> ";
        result += names[i];
    }
    return result;
}

std::string extractionOwner(const std::string& variable_name, const std::string& task_name) {
    if (!variable_name.empty()) {
        return "Variable '" + variable_name + "'";
    }
    if (!task_name.empty()) {
        return "[" + task_name + "] inline shell expression";
    }
    return "Inline shell expression";
}

} // namespace

std::string errorCodeToString(TaskRunErrorCode code) {
    switch (code) {
        case TaskRunErrorCode::UNKNOWN_TASK: return "UnknownTask";
        case TaskRunErrorCode::UNDEFINED_VARIABLE: return "UndefinedVariable";
        case TaskRunErrorCode::CYCLIC_VARIABLE_REFERENCE: return "CyclicVariableReference";
        case TaskRunErrorCode::VARIABLE_EXTRACTION_ERROR: return "VariableExtractionError";
        case TaskRunErrorCode::CYCLIC_DEPENDENCY: return "CyclicDependency";
        case TaskRunErrorCode::STEP_EXECUTION_FAILURE: return "StepExecutionFailure";
        case TaskRunErrorCode::TASKFILE_SYNTAX_ERROR: return "TaskfileSyntaxError";
        case TaskRunErrorCode::COMMAND_LAUNCH_ERROR: return "CommandLaunchError";
        case TaskRunErrorCode::EXECUTION_INTERRUPTED: return "ExecutionInterrupted";
        case TaskRunErrorCode::OUTPUT_WRITE_ERROR: return "OutputWriteError";
        default: return "Unknown";
    }
}

UnknownTaskError::UnknownTaskError(const std::string& task_name)
    : TaskRunError(TaskRunErrorCode::UNKNOWN_TASK, "No task named '" + task_name + "'"),
      task_name_(task_name) {}

UnknownTaskError::UnknownTaskError(const std::string& task_name, const std::string& referenced_by)
    : TaskRunError(TaskRunErrorCode::UNKNOWN_TASK,
                   "Task '" + referenced_by + "' depends on undeclared task '" + task_name + "'"),
      task_name_(task_name),
      referenced_by_(referenced_by) {}

UndefinedVariableError::UndefinedVariableError(const std::string& variable_name)
    : TaskRunError(TaskRunErrorCode::UNDEFINED_VARIABLE,
                   "Undefined variable '" + variable_name + "'"),
      variable_name_(variable_name) {}

CyclicVariableReferenceError::CyclicVariableReferenceError(std::vector<std::string> chain)
    : TaskRunError(TaskRunErrorCode::CYCLIC_VARIABLE_REFERENCE,
                   "Recursive variable reference: " + joinChain(chain)),
      chain_(std::move(chain)) {}

VariableExtractionError::VariableExtractionError(const std::string& variable_name,
                                                 const std::string& command, int exit_code,
                                                 const std::string& task_name)
    : TaskRunError(TaskRunErrorCode::VARIABLE_EXTRACTION_ERROR,
                   extractionOwner(variable_name, task_name) +
                   ": command '" + command + "' exited with code " + std::to_string(exit_code)),
      variable_name_(variable_name),
      task_name_(task_name),
      command_(command),
      exit_code_(exit_code) {}

CyclicDependencyError::CyclicDependencyError(std::vector<std::string> cycle)
    : TaskRunError(TaskRunErrorCode::CYCLIC_DEPENDENCY,
                   "Circular dependency: " + joinChain(cycle)),
      cycle_(std::move(cycle)) {}

StepExecutionFailure::StepExecutionFailure(const std::string& task_name, size_t step_number,
                                           const std::string& command, int exit_code)
    : TaskRunError(TaskRunErrorCode::STEP_EXECUTION_FAILURE,
                   "[" + task_name + "] step " + std::to_string(step_number) +
                   " failed with exit code " + std::to_string(exit_code) + ": " + command),
      task_name_(task_name),
      step_number_(step_number),
      command_(command),
      exit_code_(exit_code) {}

TaskfileSyntaxError::TaskfileSyntaxError(const std::string& source, size_t line, const std::string& detail)
    : TaskRunError(TaskRunErrorCode::TASKFILE_SYNTAX_ERROR,
                   source + (line > 0 ? ":" + std::to_string(line) : std::string()) + ": " + detail),
      source_(source),
      line_(line),
      detail_(detail) {}

CommandLaunchError::CommandLaunchError(const std::string& command, const std::string& reason)
    : TaskRunError(TaskRunErrorCode::COMMAND_LAUNCH_ERROR,
                   "Cannot run '" + command + "': " + reason) {}

ExecutionInterrupted::ExecutionInterrupted(int signal_number)
    : TaskRunError(TaskRunErrorCode::EXECUTION_INTERRUPTED,
                   "Interrupted by signal " + std::to_string(signal_number) +
                   " (" + std::string(strsignal(signal_number)) + ")"),
      signal_number_(signal_number) {}

OutputWriteError::OutputWriteError(const std::string& what)
    : TaskRunError(TaskRunErrorCode::OUTPUT_WRITE_ERROR, what) {}

} // namespace TaskGraph
} // namespace PHR
