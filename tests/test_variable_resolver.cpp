// EN: Unit tests for VariableResolver
// FR: Tests unitaires du VariableResolver

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

#include "taskgraph/expression.hpp"
#include "taskgraph/task_errors.hpp"
#include "taskgraph/variable_resolver.hpp"
#include "mock_command_runner.hpp"

using namespace PHR;
using namespace PHR::TaskGraph;
using PHR::Testing::MockCommandRunner;
using PHR::Testing::exitWith;
using ::testing::_;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

// EN: Test fixture for VariableResolver with a mocked runner
// FR: Fixture de test pour VariableResolver avec un runner simulé
class VariableResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<NiceMock<MockCommandRunner>>();
        resolver_ = std::make_unique<VariableResolver>(runner_);
    }

    std::shared_ptr<NiceMock<MockCommandRunner>> runner_;
    std::unique_ptr<VariableResolver> resolver_;
};

TEST_F(VariableResolverTest, ResolvesNestedReferences) {
    resolver_->declare("DOCKER_OWNER", "helxplatform");
    resolver_->declare("DOCKER_APP", "dug");
    resolver_->declare("DOCKER_TAG", "2.0");
    resolver_->declare("DOCKER_IMAGE", "${DOCKER_OWNER}/${DOCKER_APP}:$(DOCKER_TAG)");

    EXPECT_EQ(resolver_->resolve("DOCKER_IMAGE"), "helxplatform/dug:2.0");
}

TEST_F(VariableResolverTest, ReferenceMayPrecedeDeclaration) {
    resolver_->declare("IMAGE", "$(OWNER)/app");
    resolver_->declare("OWNER", "me");

    EXPECT_EQ(resolver_->resolve("IMAGE"), "me/app");
}

TEST_F(VariableResolverTest, UndefinedVariableThrows) {
    resolver_->declare("A", "$(MISSING)");

    try {
        resolver_->resolve("A");
        FAIL() << "Expected UndefinedVariableError";
    } catch (const UndefinedVariableError& e) {
        EXPECT_EQ(e.variableName(), "MISSING");
        EXPECT_EQ(e.code(), TaskRunErrorCode::UNDEFINED_VARIABLE);
    }
}

TEST_F(VariableResolverTest, CyclicReferenceNamesTheChain) {
    resolver_->declare("A", "$(B)");
    resolver_->declare("B", "x$(A)");

    try {
        resolver_->resolve("A");
        FAIL() << "Expected CyclicVariableReferenceError";
    } catch (const CyclicVariableReferenceError& e) {
        EXPECT_EQ(e.chain(), (std::vector<std::string>{"A", "B", "A"}));
        EXPECT_THAT(e.what(), ::testing::HasSubstr("A -> B -> A"));
    }

    // EN: The resolver stays usable after the error
    // FR: Le résolveur reste utilisable après l'erreur
    resolver_->declare("B", "fixed");
    EXPECT_EQ(resolver_->resolve("A"), "fixed");
}

TEST_F(VariableResolverTest, ExtractionTrimsTrailingWhitespaceAndRunsOnce) {
    resolver_->declare("VERSION_FILE", "./src/pkg/_version.py");
    resolver_->declare("VERSION", "$(shell cut -d \" \" -f 3 ${VERSION_FILE})");

    EXPECT_CALL(*runner_, run(Eq("cut -d \" \" -f 3 ./src/pkg/_version.py"), CommandOutputMode::CAPTURE))
        .Times(1)
        .WillOnce(Return(exitWith(0, "1.2.3\n\n")));

    EXPECT_EQ(resolver_->resolve("VERSION"), "1.2.3");
    EXPECT_EQ(resolver_->resolve("VERSION"), "1.2.3");
    EXPECT_EQ(resolver_->interpolate("echo \"version $(VERSION)\""), "echo \"version 1.2.3\"");
    EXPECT_EQ(resolver_->extractionCount(), 1u);
}

TEST_F(VariableResolverTest, FailingExtractionIsNeverDefaulted) {
    resolver_->declare("VERSION", "$(shell cat missing.txt)");

    EXPECT_CALL(*runner_, run(_, CommandOutputMode::CAPTURE))
        .WillOnce(Return(exitWith(1)));

    try {
        resolver_->resolve("VERSION");
        FAIL() << "Expected VariableExtractionError";
    } catch (const VariableExtractionError& e) {
        EXPECT_EQ(e.variableName(), "VERSION");
        EXPECT_EQ(e.command(), "cat missing.txt");
        EXPECT_EQ(e.exitCode(), 1);
    }
}

TEST_F(VariableResolverTest, LaunchFailureBecomesCommandLaunchError) {
    resolver_->declare("X", "$(shell true)");

    EXPECT_CALL(*runner_, run(_, _))
        .WillOnce(Throw(std::system_error(EAGAIN, std::generic_category(), "fork() failed")));

    EXPECT_THROW(resolver_->resolve("X"), CommandLaunchError);
}

TEST_F(VariableResolverTest, InlineExtractionInCommandText) {
    EXPECT_CALL(*runner_, run(Eq("date +%Y"), CommandOutputMode::CAPTURE))
        .WillOnce(Return(exitWith(0, "2026\n")));

    EXPECT_EQ(resolver_->interpolate("echo ${shell date +%Y}"), "echo 2026");
}

TEST_F(VariableResolverTest, RedeclarationClearsMemoizedValues) {
    resolver_->declare("STAMP", "$(shell date)");
    resolver_->declare("LABEL", "v1");

    EXPECT_CALL(*runner_, run(Eq("date"), _))
        .Times(2)
        .WillRepeatedly(Return(exitWith(0, "now")));

    resolver_->resolve("STAMP");
    resolver_->declare("LABEL", "v2");
    resolver_->resolve("STAMP");
    EXPECT_EQ(resolver_->resolve("LABEL"), "v2");
}

TEST_F(VariableResolverTest, ConditionalDeclarationKeepsExistingValue) {
    EXPECT_TRUE(resolver_->declareIfAbsent("PYTHON", "python3"));
    EXPECT_FALSE(resolver_->declareIfAbsent("PYTHON", "python2"));
    EXPECT_EQ(resolver_->resolve("PYTHON"), "python3");
    EXPECT_EQ(resolver_->names(), std::vector<std::string>{"PYTHON"});
}

// EN: Extraction through a real /bin/sh
// FR: Extraction via un vrai /bin/sh
TEST(VariableResolverShellTest, VersionExtractedFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "phonyrun_version_test.txt";
    {
        std::ofstream file(path);
        file << "v 1.2.3\n";
    }

    ShellCommandRunner::Config config;
    config.track_child = false;
    VariableResolver resolver(std::make_shared<ShellCommandRunner>(config));
    resolver.declare("VERSION_FILE", Expression::literal(path.string()));
    resolver.declare("VERSION", "$(shell cut -d \" \" -f 2 ${VERSION_FILE})");

    EXPECT_EQ(resolver.resolve("VERSION"), "1.2.3");
    EXPECT_EQ(resolver.interpolate("docker build -t app:$(VERSION) ."), "docker build -t app:1.2.3 .");

    std::filesystem::remove(path);
}
