// EN: Integration tests for TaskCli with a mocked command runner and temporary task files
// FR: Tests d'intégration de TaskCli avec un runner simulé et des fichiers de tâches temporaires

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "cli/task_cli.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "mock_command_runner.hpp"

using namespace PHR;
using namespace PHR::CLI;
using PHR::Testing::MockCommandRunner;
using PHR::Testing::exitWith;
using ::testing::_;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const char* const kTaskfile =
    "PYTHON = python3\n"
    ".DEFAULT_GOAL = hello\n"
    "\n"
    "#hello: Say hello\n"
    "hello:\n"
    "\t@echo hello\n"
    "\n"
    "#clean: Remove artifacts\n"
    "clean:\n"
    "\trm -rf build\n"
    "\n"
    "#build: Build the package\n"
    "build: clean\n"
    "\t$(PYTHON) -m build\n"
    "\n"
    "#test: Run all tests\n"
    "test: clean\n"
    "\t$(PYTHON) -m pytest\n"
    "\n"
    "broken:\n"
    "\tfalse\n";

} // namespace

// EN: Test fixture: a temporary working directory and a strict mock runner
// FR: Fixture de test : un répertoire de travail temporaire et un runner simulé strict
class TaskCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        SignalHandler::getInstance().reset();
        test_dir_ = std::filesystem::temp_directory_path() / "phonyrun_cli_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        runner_ = std::make_shared<::testing::StrictMock<MockCommandRunner>>();

        config_.working_directory = test_dir_.string();
        config_.echo_commands = true;
        config_.help_color = false;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        SignalHandler::getInstance().reset();
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream file(test_dir_ / name);
        file << content;
    }

    int run(const std::vector<std::string>& args) {
        TaskCli cli(config_, runner_, out_, err_);
        return cli.run(args);
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<::testing::StrictMock<MockCommandRunner>> runner_;
    TaskCliConfig config_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(TaskCliTest, RunsDefaultGoalWithoutArguments) {
    writeFile("Taskfile", kTaskfile);
    EXPECT_CALL(*runner_, run(Eq("echo hello"), CommandOutputMode::INHERIT)).WillOnce(Return(exitWith(0)));

    EXPECT_EQ(run({}), 0);
    // EN: "@" steps are not echoed
    // FR: Les étapes "@" ne sont pas affichées
    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(err_.str(), "");
}

TEST_F(TaskCliTest, BatchRunsSharedPrerequisiteOnce) {
    writeFile("Taskfile", kTaskfile);
    {
        InSequence seq;
        EXPECT_CALL(*runner_, run(Eq("rm -rf build"), _)).WillOnce(Return(exitWith(0)));
        EXPECT_CALL(*runner_, run(Eq("python3 -m build"), _)).WillOnce(Return(exitWith(0)));
        EXPECT_CALL(*runner_, run(Eq("python3 -m pytest"), _)).WillOnce(Return(exitWith(0)));
    }

    EXPECT_EQ(run({"build", "test"}), 0);
    EXPECT_EQ(out_.str(), "rm -rf build\npython3 -m build\npython3 -m pytest\n");
}

TEST_F(TaskCliTest, UnknownTaskRunsNothing) {
    writeFile("Taskfile", kTaskfile);
    EXPECT_CALL(*runner_, run(_, _)).Times(0);

    EXPECT_EQ(run({"build", "deploy"}), 2);
    EXPECT_EQ(err_.str(), "phonyrun: *** No task named 'deploy'\n");
}

TEST_F(TaskCliTest, StepFailureExitCodeIsPropagated) {
    writeFile("Taskfile", kTaskfile);
    EXPECT_CALL(*runner_, run(Eq("false"), _)).WillOnce(Return(exitWith(7)));

    EXPECT_EQ(run({"broken", "hello"}), 7);
    EXPECT_THAT(err_.str(), HasSubstr("phonyrun: *** [broken] step 1 failed with exit code 7: false"));
}

TEST_F(TaskCliTest, BuiltinHelpListsDocumentedTasks) {
    writeFile("Taskfile", kTaskfile);
    EXPECT_CALL(*runner_, run(_, _)).Times(0);

    EXPECT_EQ(run({"help"}), 0);
    EXPECT_EQ(out_.str(),
              "hello                Say hello\n"
              "clean                Remove artifacts\n"
              "build                Build the package\n"
              "test                 Run all tests\n");
}

TEST_F(TaskCliTest, DeclaredHelpTaskRunsLikeAnyOther) {
    writeFile("Taskfile", "#help: Show help\nhelp:\n\t@grep -E '^#' $(MAKEFILE_LIST)\n");
    const std::string taskfile = (test_dir_ / "Taskfile").string();
    EXPECT_CALL(*runner_, run(Eq("grep -E '^#' " + taskfile), _)).WillOnce(Return(exitWith(0)));

    EXPECT_EQ(run({}), 0);
}

TEST_F(TaskCliTest, CycleIsReportedWithReservedCode) {
    writeFile("Taskfile", "a: b\nb: a\n");
    config_.failure_exit_code = 9;
    EXPECT_CALL(*runner_, run(_, _)).Times(0);

    EXPECT_EQ(run({"a"}), 9);
    EXPECT_THAT(err_.str(), HasSubstr("Circular dependency: a -> b -> a"));
}

TEST_F(TaskCliTest, DanglingPrerequisiteFailsAtLoad) {
    writeFile("Taskfile", "test: test.doc\n\techo test\n");
    EXPECT_CALL(*runner_, run(_, _)).Times(0);

    EXPECT_EQ(run({"test"}), 2);
    EXPECT_THAT(err_.str(), HasSubstr("depends on undeclared task 'test.doc'"));
}

TEST_F(TaskCliTest, MissingTaskfileIsReported) {
    EXPECT_EQ(run({"build"}), 2);
    EXPECT_THAT(err_.str(), HasSubstr("no task file found"));
}

TEST_F(TaskCliTest, YamlTaskfileIsPickedByExtension) {
    writeFile("Taskfile.yaml",
              "default: greet\n"
              "tasks:\n"
              "  - name: greet\n"
              "    steps: [\"echo hi\"]\n");
    EXPECT_CALL(*runner_, run(Eq("echo hi"), _)).WillOnce(Return(exitWith(0)));

    EXPECT_EQ(run({}), 0);
}

TEST_F(TaskCliTest, ExplicitTaskfileWinsOverDefaults) {
    writeFile("Taskfile", kTaskfile);
    writeFile("ci.json", R"({"tasks": [{"name": "ci", "steps": ["make ci"]}]})");
    config_.taskfile = "ci.json";
    EXPECT_CALL(*runner_, run(Eq("make ci"), _)).WillOnce(Return(exitWith(0)));

    EXPECT_EQ(run({"ci"}), 0);
}

TEST_F(TaskCliTest, ReportIsWrittenOnFailure) {
    writeFile("Taskfile", kTaskfile);
    config_.report_file = "report.json";
    EXPECT_CALL(*runner_, run(Eq("rm -rf build"), _)).WillOnce(Return(exitWith(1)));

    EXPECT_EQ(run({"build"}), 1);

    std::ifstream file(test_dir_ / "report.json");
    ASSERT_TRUE(file.is_open());
    nlohmann::json report = nlohmann::json::parse(file);
    EXPECT_EQ(report["exit_code"], 1);
    EXPECT_EQ(report["plan"], nlohmann::json::array({"clean", "build"}));
    EXPECT_EQ(report["tasks"][0]["status"], "FAILED");
    EXPECT_EQ(report["tasks"][1]["status"], "PENDING");
}

TEST_F(TaskCliTest, ConfigFromManagerAppliesDefaultsAndOverrides) {
    auto& manager = ConfigManager::getInstance();
    manager.reset();
    ASSERT_TRUE(manager.loadFromString(
        "runner:\n"
        "  echo_commands: false\n"
        "  failure_exit_code: 3\n"
        "help:\n"
        "  name_width: 12\n"));

    TaskCliConfig config = TaskCliConfig::fromConfigManager(manager);
    EXPECT_FALSE(config.echo_commands);
    EXPECT_EQ(config.failure_exit_code, 3);
    EXPECT_EQ(config.help_name_width, 12u);
    EXPECT_EQ(config.shell, "/bin/sh");
    EXPECT_EQ(config.default_task, "help");
    EXPECT_TRUE(config.help_color);

    manager.addValidationRules(TaskCliConfig::validationRules());
    std::vector<std::string> errors;
    EXPECT_TRUE(manager.validate(errors));

    manager.set("runner.failure_exit_code", ConfigValue(0));
    EXPECT_FALSE(manager.validate(errors));
    manager.reset();
}
