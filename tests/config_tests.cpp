#include <fstream>
#include <iostream>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

#include <config.hpp>

#include "test_helpers.hpp"

using namespace NWorkspace;

TEST(Config, DefaultsWithoutArguments) {
    const char* argv[] = {"workspace_cli"};
    std::ostringstream out;

    auto config = ParseConfig(1, argv, out);

    ASSERT_TRUE(config);
    EXPECT_EQ(config->DataDir.string(), "workspace-data");
    EXPECT_EQ(config->LogLevel, "info");
    EXPECT_FALSE(config->LogFile);
    EXPECT_TRUE(config->Account.empty());
    EXPECT_EQ(config->Retry.MaxAttempts, 3u);
    EXPECT_TRUE(out.str().empty());
}

TEST(Config, CommandLineOverridesFile) {
    TTempDir dir;
    auto path = (dir.Path() / "workspace.conf").string();
    {
        std::ofstream ofs(path);
        ofs << "data-dir=/from/file\n"
            << "retry-attempts=5\n"
            << "log-level=debug\n"
            << "account=noy\n";
    }
    const char* argv[] = {"workspace_cli", "--config", path.c_str(), "--data-dir", "/from/cli", "--retry-base-ms", "50"};

    auto config = ParseConfig(7, argv, std::cout);

    ASSERT_TRUE(config);
    EXPECT_EQ(config->DataDir.string(), "/from/cli");
    EXPECT_EQ(config->Retry.MaxAttempts, 5u);
    EXPECT_EQ(config->Retry.BaseDelay.count(), 50);
    EXPECT_EQ(config->LogLevel, "debug");
    EXPECT_EQ(config->Account, "noy");
}

TEST(Config, HelpPrintsOptions) {
    const char* argv[] = {"workspace_cli", "--help"};
    std::ostringstream out;

    EXPECT_FALSE(ParseConfig(2, argv, out));
    EXPECT_NE(out.str().find("--remote-dir"), std::string::npos);
}

static void ExpectInvalid(std::vector<const char*> args) {
    std::ostringstream out;
    try {
        ParseConfig(static_cast<int>(args.size()), args.data(), out);
        ADD_FAILURE() << "accepted " << args.back();
    } catch (const TWorkspaceError& e) {
        EXPECT_EQ(e.Code(), EWorkspaceError::InvalidArgument);
    }
}

TEST(Config, BadValuesAreInvalidArgument) {
    ExpectInvalid({"workspace_cli", "--log-level", "loud"});
    ExpectInvalid({"workspace_cli", "--colour"});
    ExpectInvalid({"workspace_cli", "--config", "/nonexistent/workspace.conf"});
    ExpectInvalid({"workspace_cli", "--retry-max-ms=-5"});
}
