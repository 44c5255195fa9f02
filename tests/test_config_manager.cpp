// EN: Unit tests for ConfigManager - YAML loading, dotted keys, environment overrides, validation
// FR: Tests unitaires pour ConfigManager - chargement YAML, clés pointées, surcharges d'environnement, validation

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

using namespace PHR;

// EN: Test fixture resetting the singleton around every test
// FR: Fixture de test réinitialisant le singleton autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("PHR_RUNNER_SHELL");
        unsetenv("PHR_HELP_NAME_WIDTH");
        unsetenv("PHR_TASKFILE");
        unsetenv("PHONYRUN_TEST_HOME");
    }

    ConfigManager& manager() { return ConfigManager::getInstance(); }
};

TEST_F(ConfigManagerTest, LoadsSectionsAndTypedScalars) {
    ASSERT_TRUE(manager().loadFromString(
        "runner:\n"
        "  shell: /bin/bash\n"
        "  echo_commands: false\n"
        "  failure_exit_code: 4\n"
        "help:\n"
        "  ratio: 0.5\n"
        "  names: [build, test]\n"
        "taskfile: Taskfile.yaml\n"));

    EXPECT_EQ(manager().get("runner", "shell").as<std::string>(), "/bin/bash");
    EXPECT_FALSE(manager().get("runner.echo_commands").as<bool>());
    EXPECT_EQ(manager().get("runner.failure_exit_code").as<int>(), 4);
    EXPECT_DOUBLE_EQ(manager().get("help.ratio").as<double>(), 0.5);
    EXPECT_EQ(manager().get("help.names").as<std::vector<std::string>>(),
              (std::vector<std::string>{"build", "test"}));
    // EN: Top-level scalars land in the "default" section
    // FR: Les scalaires de premier niveau vont dans la section "default"
    EXPECT_EQ(manager().get("taskfile").as<std::string>(), "Taskfile.yaml");
    EXPECT_EQ(manager().getSectionNames(), (std::vector<std::string>{"default", "help", "runner"}));
}

TEST_F(ConfigManagerTest, QuotedScalarsStayStrings) {
    ASSERT_TRUE(manager().loadFromString("runner:\n  failure_exit_code: \"7\"\n  echo_commands: 'true'\n"));

    EXPECT_EQ(manager().get("runner.failure_exit_code").as<std::string>(), "7");
    EXPECT_FALSE(manager().get("runner.failure_exit_code").tryAs<int>().has_value());
    EXPECT_EQ(manager().get("runner.echo_commands").as<std::string>(), "true");
}

TEST_F(ConfigManagerTest, InvalidDocumentsAreRejected) {
    EXPECT_FALSE(manager().loadFromString("runner: [unclosed"));
    EXPECT_FALSE(manager().loadFromString("- just\n- a list\n"));
    EXPECT_FALSE(manager().loadFromFile("/nonexistent/phonyrun.yaml"));
    EXPECT_TRUE(manager().loadFromString(""));
}

TEST_F(ConfigManagerTest, DottedKeysReadAndWrite) {
    manager().set("runner.shell", ConfigValue("/bin/zsh"));
    EXPECT_TRUE(manager().has("runner", "shell"));
    EXPECT_TRUE(manager().has("runner.shell"));
    EXPECT_EQ(manager().get("runner", "shell").as<std::string>(), "/bin/zsh");

    manager().remove("runner.shell");
    EXPECT_FALSE(manager().has("runner.shell"));
    EXPECT_FALSE(manager().get("runner.shell").isValid());

    EXPECT_EQ(ConfigManager::splitKey("help.name_width"),
              (std::pair<std::string, std::string>{"help", "name_width"}));
    EXPECT_EQ(ConfigManager::splitKey("taskfile"),
              (std::pair<std::string, std::string>{"default", "taskfile"}));
}

TEST_F(ConfigManagerTest, EnvironmentOverridesWin) {
    ASSERT_TRUE(manager().loadFromString("runner:\n  shell: /bin/sh\n"));
    setenv("PHR_RUNNER_SHELL", "/bin/bash", 1);
    setenv("PHR_HELP_NAME_WIDTH", "30", 1);
    setenv("PHR_TASKFILE", "ci/Taskfile", 1);

    EXPECT_GE(manager().loadEnvironmentOverrides("PHR_"), 3u);
    EXPECT_EQ(manager().get("runner.shell").as<std::string>(), "/bin/bash");
    EXPECT_EQ(manager().get("help.name_width").as<int>(), 30);
    EXPECT_EQ(manager().get("taskfile").as<std::string>(), "ci/Taskfile");
}

TEST_F(ConfigManagerTest, EnvironmentReferencesAreExpanded) {
    setenv("PHONYRUN_TEST_HOME", "/home/ci", 1);
    ASSERT_TRUE(manager().loadFromString(
        "logging:\n"
        "  file: ${PHONYRUN_TEST_HOME}/phonyrun.log\n"
        "  other: ${PHONYRUN_UNSET_VARIABLE}\n"));

    EXPECT_EQ(manager().get("logging.file").as<std::string>(), "/home/ci/phonyrun.log");
    EXPECT_EQ(manager().get("logging.other").as<std::string>(), "${PHONYRUN_UNSET_VARIABLE}");
}

TEST_F(ConfigManagerTest, ValidationRulesReportEveryError) {
    ASSERT_TRUE(manager().loadFromString(
        "runner:\n"
        "  failure_exit_code: 300\n"
        "  echo_commands: maybe\n"
        "logging:\n"
        "  level: VERBOSE\n"));

    ConfigManager::ValidationRule exit_code;
    exit_code.key = "runner.failure_exit_code";
    exit_code.type = "int";
    exit_code.min_value = 1;
    exit_code.max_value = 255;

    ConfigManager::ValidationRule echo;
    echo.key = "runner.echo_commands";
    echo.type = "bool";

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"DEBUG", "INFO", "WARN", "ERROR"};

    ConfigManager::ValidationRule shell;
    shell.key = "runner.shell";
    shell.type = "string";
    shell.required = true;

    manager().addValidationRules({exit_code, echo, level, shell});

    std::vector<std::string> errors;
    EXPECT_FALSE(manager().validate(errors));
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0], "Configuration runner.failure_exit_code must be <= 255");
    EXPECT_EQ(errors[1], "Configuration runner.echo_commands must be a boolean");
    EXPECT_EQ(errors[2], "Configuration logging.level must be one of: DEBUG, INFO, WARN, ERROR");
    EXPECT_EQ(errors[3], "Required configuration missing: runner.shell");
}

TEST_F(ConfigManagerTest, LoadsFromFileAndReplacesSections) {
    const auto path = std::filesystem::temp_directory_path() / "phonyrun_config_test.yaml";
    {
        std::ofstream file(path);
        file << "runner:\n  shell: /bin/sh\n  failure_exit_code: 3\nhelp:\n  color: false\n";
    }
    manager().set("report.file", ConfigValue("stale.json"));

    ASSERT_TRUE(manager().loadFromFile(path.string()));
    EXPECT_EQ(manager().get("runner.shell").as<std::string>(), "/bin/sh");
    EXPECT_EQ(manager().get("runner.failure_exit_code").as<int>(), 3);
    EXPECT_FALSE(manager().get("help.color").as<bool>());
    EXPECT_FALSE(manager().has("report.file"));
    std::filesystem::remove(path);
}

TEST(ConfigValueTest, ParseScalarPicksNarrowestType) {
    EXPECT_TRUE(ConfigManager::parseScalar("true").as<bool>());
    EXPECT_EQ(ConfigManager::parseScalar("42").as<int>(), 42);
    EXPECT_DOUBLE_EQ(ConfigManager::parseScalar("2.5").as<double>(), 2.5);
    EXPECT_EQ(ConfigManager::parseScalar("/bin/sh").as<std::string>(), "/bin/sh");
    EXPECT_EQ(ConfigManager::parseScalar("").as<std::string>(), "");
    EXPECT_FALSE(ConfigManager::parseScalar("99999999999").tryAs<int>().has_value());
}

TEST(ConfigValueTest, AccessorsAndToString) {
    ConfigValue empty;
    EXPECT_FALSE(empty.isValid());
    EXPECT_THROW(empty.as<int>(), std::runtime_error);
    EXPECT_EQ(empty.toString(), "<empty>");

    ConfigValue number(5);
    EXPECT_THROW(number.as<std::string>(), std::runtime_error);
    EXPECT_EQ(number.asOrDefault<std::string>("fallback"), "fallback");
    EXPECT_EQ(ConfigValue(std::vector<std::string>{"a", "b"}).toString(), "[a, b]");
    EXPECT_EQ(ConfigValue(true).toString(), "true");
}
