// EN: Embedding example: builds a task graph in code, prints the plan and runs it with /bin/sh.
// FR: Exemple d'intégration : construit un graphe de tâches en code, affiche le plan et l'exécute avec /bin/sh.

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_runner.hpp"
#include "taskgraph/dependency_executor.hpp"
#include "taskgraph/task_errors.hpp"
#include "taskgraph/task_utils.hpp"
#include <iostream>
#include <memory>

int main() {
    using namespace PHR::TaskGraph;

    auto& logger = PHR::Logger::getInstance();
    logger.setLogLevel(PHR::LogLevel::INFO);
    logger.setCorrelationId(logger.generateCorrelationId());

    auto runner = std::make_shared<PHR::ShellCommandRunner>();
    VariableResolver resolver(runner);
    resolver.declare("GREETING", "hello from");
    resolver.declare("KERNEL", "$(shell uname -s)");

    TaskRegistry registry;

    TaskDefinition prepare;
    prepare.name = "prepare";
    prepare.description = "Create the scratch directory";
    prepare.steps.push_back({parseExpression("mkdir -p /tmp/phonyrun-example"), false});
    registry.declare(prepare);

    TaskDefinition greet;
    greet.name = "greet";
    greet.description = "Print a greeting";
    greet.prerequisites = {"prepare"};
    greet.steps.push_back({parseExpression("echo $(GREETING) $(KERNEL)"), false});
    greet.steps.push_back({parseExpression("echo 'cost: 5$$'"), true});
    registry.declare(greet);

    try {
        registry.validateReferences();

        DependencyExecutor executor(registry, resolver, runner);
        ExecutionPlan plan = executor.plan("greet");

        std::cout << "Plan:";
        for (const auto& name : plan.order) {
            std::cout << " " << name;
        }
        std::cout << std::endl;

        TaskRunSession session;
        session.registerPlan(plan);
        executor.execute(plan, session);

        for (const auto& result : session.getAllResults()) {
            std::cout << result.task_name << ": " << TaskUtils::statusToString(result.status)
                      << " (" << result.steps_run << " steps, "
                      << TaskUtils::formatDuration(result.duration) << ")" << std::endl;
        }
    } catch (const TaskRunError& e) {
        LOG_ERROR("taskgraph_example", errorCodeToString(e.code()) + ": " + e.what());
        return 2;
    }

    LOG_INFO("taskgraph_example", "Example finished");
    return 0;
}
