// EN: Error types raised by the task graph engine. Every engine error is fatal to the run.
// FR: Types d'erreurs levées par le moteur de graphe de tâches. Toute erreur du moteur est fatale.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace PHR {
namespace TaskGraph {

// EN: Error kinds reported to the user
// FR: Catégories d'erreurs rapportées à l'utilisateur
enum class TaskRunErrorCode {
    UNKNOWN_TASK,
    UNDEFINED_VARIABLE,
    CYCLIC_VARIABLE_REFERENCE,
    VARIABLE_EXTRACTION_ERROR,
    CYCLIC_DEPENDENCY,
    STEP_EXECUTION_FAILURE,
    TASKFILE_SYNTAX_ERROR,
    COMMAND_LAUNCH_ERROR,
    EXECUTION_INTERRUPTED,
    OUTPUT_WRITE_ERROR
};

std::string errorCodeToString(TaskRunErrorCode code);

// EN: Base class of every engine error; carries the error kind.
// FR: Classe de base de toutes les erreurs du moteur ; porte la catégorie d'erreur.
class TaskRunError : public std::runtime_error {
public:
    TaskRunError(TaskRunErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    TaskRunErrorCode code() const noexcept { return code_; }

private:
    TaskRunErrorCode code_;
};

class UnknownTaskError : public TaskRunError {
public:
    explicit UnknownTaskError(const std::string& task_name);
    UnknownTaskError(const std::string& task_name, const std::string& referenced_by);

    const std::string& taskName() const noexcept { return task_name_; }
    const std::string& referencedBy() const noexcept { return referenced_by_; }

private:
    std::string task_name_;
    std::string referenced_by_;
};

class UndefinedVariableError : public TaskRunError {
public:
    explicit UndefinedVariableError(const std::string& variable_name);

    const std::string& variableName() const noexcept { return variable_name_; }

private:
    std::string variable_name_;
};

class CyclicVariableReferenceError : public TaskRunError {
public:
    // EN: chain starts and ends with the same variable, e.g. {A, B, A}
    // FR: la chaîne commence et finit par la même variable, ex. {A, B, A}
    explicit CyclicVariableReferenceError(std::vector<std::string> chain);

    const std::vector<std::string>& chain() const noexcept { return chain_; }

private:
    std::vector<std::string> chain_;
};

class VariableExtractionError : public TaskRunError {
public:
    // EN: variable_name is empty for an inline $(shell ...) inside a step; task_name then names the step owner
    // FR: variable_name est vide pour un $(shell ...) dans une étape ; task_name nomme alors la tâche
    VariableExtractionError(const std::string& variable_name, const std::string& command, int exit_code,
                            const std::string& task_name = "");

    const std::string& variableName() const noexcept { return variable_name_; }
    const std::string& taskName() const noexcept { return task_name_; }
    const std::string& command() const noexcept { return command_; }
    int exitCode() const noexcept { return exit_code_; }

private:
    std::string variable_name_;
    std::string task_name_;
    std::string command_;
    int exit_code_;
};

class CyclicDependencyError : public TaskRunError {
public:
    // EN: cycle starts and ends with the same task, e.g. {A, B, A}
    // FR: le cycle commence et finit par la même tâche, ex. {A, B, A}
    explicit CyclicDependencyError(std::vector<std::string> cycle);

    const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::string> cycle_;
};

class StepExecutionFailure : public TaskRunError {
public:
    StepExecutionFailure(const std::string& task_name, size_t step_number,
                         const std::string& command, int exit_code);

    const std::string& taskName() const noexcept { return task_name_; }
    // EN: 1-based index of the failing step within its task
    // FR: Index (base 1) de l'étape en échec dans sa tâche
    size_t stepNumber() const noexcept { return step_number_; }
    const std::string& command() const noexcept { return command_; }
    int exitCode() const noexcept { return exit_code_; }

private:
    std::string task_name_;
    size_t step_number_;
    std::string command_;
    int exit_code_;
};

class TaskfileSyntaxError : public TaskRunError {
public:
    TaskfileSyntaxError(const std::string& source, size_t line, const std::string& detail);

    const std::string& source() const noexcept { return source_; }
    // EN: 1-based line number, 0 when the error is not tied to a line
    // FR: Numéro de ligne (base 1), 0 si l'erreur n'est liée à aucune ligne
    size_t line() const noexcept { return line_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    std::string source_;
    size_t line_;
    std::string detail_;
};

class CommandLaunchError : public TaskRunError {
public:
    CommandLaunchError(const std::string& command, const std::string& reason);
};

class ExecutionInterrupted : public TaskRunError {
public:
    explicit ExecutionInterrupted(int signal_number);

    int signalNumber() const noexcept { return signal_number_; }

private:
    int signal_number_;
};

class OutputWriteError : public TaskRunError {
public:
    explicit OutputWriteError(const std::string& what);
};

} // namespace TaskGraph
} // namespace PHR
