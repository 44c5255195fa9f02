#include "cli/help_generator.hpp"
#include "taskgraph/task_errors.hpp"

#include <ostream>

namespace PHR {
namespace CLI {

namespace {

const char* const kCyan = "\033[36m";
const char* const kReset = "\033[0m";

} // namespace

HelpGenerator::HelpGenerator() : HelpGenerator(Config{}) {}

HelpGenerator::HelpGenerator(Config config) : config_(config) {}

std::string HelpGenerator::formatRow(const std::string& name, const std::string& description) const {
    std::string padded = name;
    if (padded.size() < config_.name_width) {
        padded.append(config_.name_width - padded.size(), ' ');
    }

    std::string row;
    if (config_.color) {
        row = kCyan + padded + kReset;
    } else {
        row = padded;
    }
    row += ' ';
    row += description;
    row += '\n';
    return row;
}

void HelpGenerator::write(const TaskGraph::TaskRegistry& registry, std::ostream& out) const {
    for (const auto* task : registry.listPublic()) {
        out << formatRow(task->name, task->description);
    }
    out.flush();
    if (!out) {
        throw TaskGraph::OutputWriteError("Cannot write the task listing");
    }
}

} // namespace CLI
} // namespace PHR
