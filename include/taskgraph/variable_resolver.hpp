// EN: Variable Resolver for PhonyRun - lazy, memoized evaluation of named expressions
// FR: Résolveur de variables pour PhonyRun - évaluation paresseuse et mémorisée d'expressions nommées

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "taskgraph/expression.hpp"

namespace PHR {
namespace TaskGraph {

// EN: Holds variable declarations and resolves them on demand.
// EN: A variable is evaluated at most once per declaration: shell extractions run once.
// FR: Contient les déclarations de variables et les résout à la demande.
// FR: Une variable est évaluée au plus une fois par déclaration : les extractions shell ne tournent qu'une fois.
class VariableResolver {
public:
    explicit VariableResolver(std::shared_ptr<CommandRunner> runner);

    // EN: Declare or redeclare a variable. Redeclaring clears every memoized value.
    // FR: Déclare ou redéclare une variable. Une redéclaration efface toutes les valeurs mémorisées.
    void declare(const std::string& name, Expression value);
    void declare(const std::string& name, const std::string& raw_value);

    // EN: "?=" semantics; returns false when the name was already declared
    // FR: Sémantique "?=" ; retourne false si le nom était déjà déclaré
    bool declareIfAbsent(const std::string& name, Expression value);
    bool declareIfAbsent(const std::string& name, const std::string& raw_value);

    bool isDeclared(const std::string& name) const;
    std::vector<std::string> names() const;     // EN: Declaration order / FR: Ordre de déclaration

    // EN: Throws UndefinedVariableError, CyclicVariableReferenceError, VariableExtractionError,
    // EN: CommandLaunchError, or ExecutionInterrupted when an extraction fails after a shutdown signal.
    // FR: Lance UndefinedVariableError, CyclicVariableReferenceError, VariableExtractionError,
    // FR: CommandLaunchError, ou ExecutionInterrupted si une extraction échoue après un signal d'arrêt.
    std::string resolve(const std::string& name);

    std::string interpolate(const Expression& expression);
    std::string interpolate(const std::string& text);

    size_t extractionCount() const { return extraction_count_; }

private:
    std::string evaluate(const Expression& expression);
    std::string runExtraction(const Expression& command);

    std::shared_ptr<CommandRunner> runner_;
    std::unordered_map<std::string, Expression> declarations_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::string> cache_;
    std::vector<std::string> resolving_;
    size_t extraction_count_ = 0;
};

} // namespace TaskGraph
} // namespace PHR
