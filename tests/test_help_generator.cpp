// EN: Unit tests for HelpGenerator
// FR: Tests unitaires pour HelpGenerator

#include <gtest/gtest.h>
#include <sstream>

#include "cli/help_generator.hpp"
#include "taskgraph/task_errors.hpp"

using namespace PHR::CLI;
using namespace PHR::TaskGraph;

namespace {

TaskRegistry makeRegistry() {
    TaskRegistry registry;
    TaskDefinition help;
    help.name = "help";
    help.description = "List available tasks on this project";
    registry.declare(help);

    TaskDefinition hidden;
    hidden.name = "build.python";
    registry.declare(hidden);

    TaskDefinition publish;
    publish.name = "publish";
    publish.description = "Push all build artifacts to appropriate repositories";
    registry.declare(publish);
    return registry;
}

} // namespace

TEST(HelpGeneratorTest, ColoredRowsMatchTheAwkFormat) {
    std::ostringstream out;
    HelpGenerator().write(makeRegistry(), out);

    EXPECT_EQ(out.str(),
              "\033[36mhelp                \033[0m List available tasks on this project\n"
              "\033[36mpublish             \033[0m Push all build artifacts to appropriate repositories\n");
}

TEST(HelpGeneratorTest, PlainRowsWithCustomWidth) {
    HelpGenerator::Config config;
    config.color = false;
    config.name_width = 8;
    HelpGenerator generator(config);

    EXPECT_EQ(generator.formatRow("help", "List"), "help     List\n");
    // EN: Longer names are never truncated
    // FR: Les noms plus longs ne sont jamais tronqués
    EXPECT_EQ(generator.formatRow("publish.python", "Push"), "publish.python Push\n");
}

TEST(HelpGeneratorTest, EmptyRegistryWritesNothing) {
    std::ostringstream out;
    HelpGenerator().write(TaskRegistry(), out);
    EXPECT_TRUE(out.str().empty());
}

TEST(HelpGeneratorTest, BrokenStreamRaisesOutputWriteError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(HelpGenerator().write(makeRegistry(), out), OutputWriteError);
}
