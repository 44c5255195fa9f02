#include "taskgraph/variable_resolver.hpp"
#include "taskgraph/task_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace PHR {
namespace TaskGraph {

VariableResolver::VariableResolver(std::shared_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("VariableResolver requires a command runner");
    }
}

void VariableResolver::declare(const std::string& name, Expression value) {
    if (declarations_.find(name) == declarations_.end()) {
        order_.push_back(name);
    }
    declarations_[name] = std::move(value);
    cache_.clear();
}

void VariableResolver::declare(const std::string& name, const std::string& raw_value) {
    declare(name, parseExpression(raw_value));
}

bool VariableResolver::declareIfAbsent(const std::string& name, Expression value) {
    if (isDeclared(name)) {
        return false;
    }
    declare(name, std::move(value));
    return true;
}

bool VariableResolver::declareIfAbsent(const std::string& name, const std::string& raw_value) {
    return declareIfAbsent(name, parseExpression(raw_value));
}

bool VariableResolver::isDeclared(const std::string& name) const {
    return declarations_.find(name) != declarations_.end();
}

std::vector<std::string> VariableResolver::names() const {
    return order_;
}

std::string VariableResolver::resolve(const std::string& name) {
    auto cached = cache_.find(name);
    if (cached != cache_.end()) {
        return cached->second;
    }

    auto decl = declarations_.find(name);
    if (decl == declarations_.end()) {
        throw UndefinedVariableError(name);
    }

    auto in_progress = std::find(resolving_.begin(), resolving_.end(), name);
    if (in_progress != resolving_.end()) {
        std::vector<std::string> chain(in_progress, resolving_.end());
        chain.push_back(name);
        throw CyclicVariableReferenceError(std::move(chain));
    }

    resolving_.push_back(name);
    std::string value;
    try {
        value = evaluate(decl->second);
    } catch (...) {
        resolving_.pop_back();
        throw;
    }
    resolving_.pop_back();

    LOG_DEBUG("variables", "Resolved " + name + " = '" + value + "'");
    cache_[name] = value;
    return value;
}

std::string VariableResolver::interpolate(const Expression& expression) {
    return evaluate(expression);
}

std::string VariableResolver::interpolate(const std::string& text) {
    return evaluate(parseExpression(text));
}

std::string VariableResolver::evaluate(const Expression& expression) {
    std::string out;
    for (const auto& segment : expression.segments) {
        if (const auto* literal = std::get_if<LiteralSegment>(&segment)) {
            out += literal->text;
        } else if (const auto* ref = std::get_if<ReferenceSegment>(&segment)) {
            out += resolve(ref->name);
        } else if (const auto* extraction = std::get_if<ExtractionSegment>(&segment)) {
            out += runExtraction(*extraction->command);
        }
    }
    return out;
}

std::string VariableResolver::runExtraction(const Expression& command) {
    const std::string owner = resolving_.empty() ? std::string() : resolving_.back();
    const std::string command_text = evaluate(command);

    CommandResult result;
    try {
        result = runner_->run(command_text, CommandOutputMode::CAPTURE);
    } catch (const std::system_error& e) {
        throw CommandLaunchError(command_text, e.what());
    }
    ++extraction_count_;

    if (!result.isSuccess()) {
        // EN: A child killed by our own shutdown is an interrupt, not a failed extraction
        // FR: Un enfant tué par notre propre arrêt est une interruption, pas une extraction échouée
        auto& signals = SignalHandler::getInstance();
        if (signals.isShutdownRequested()) {
            throw ExecutionInterrupted(signals.getReceivedSignal());
        }
        throw VariableExtractionError(owner, command_text, result.exit_code);
    }

    std::string output = std::move(result.standard_output);
    while (!output.empty() && std::isspace(static_cast<unsigned char>(output.back()))) {
        output.pop_back();
    }
    return output;
}

} // namespace TaskGraph
} // namespace PHR
