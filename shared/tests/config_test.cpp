#include <gtest/gtest.h>
#include <cstdlib>
#include "config.hpp"
#include "staging_result.hpp"

using namespace std;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("PSTAGE_GIT");
        unsetenv("PSTAGE_VERBOSE");
    }
};

TEST_F(ConfigTest, VerbosityWords) {
    EXPECT_EQ(parse_verbosity("2"), 2);
    EXPECT_EQ(parse_verbosity("true"), 1);
    EXPECT_EQ(parse_verbosity("off"), 0);
    EXPECT_EQ(parse_verbosity(""), 0);
    EXPECT_EQ(parse_verbosity("-4"), 0);
    EXPECT_EQ(parse_verbosity("loud"), 0);
}

TEST_F(ConfigTest, EnvironmentWins) {
    setenv("PSTAGE_GIT", "pstage-no-such-git", 1);
    setenv("PSTAGE_VERBOSE", "2", 1);

    StageConfig config = load_config("/");
    EXPECT_EQ(config.git_binary, "pstage-no-such-git");
    EXPECT_EQ(config.verbose, 2);
    EXPECT_EQ(config.repo_root, "/");
    EXPECT_FALSE(config.text_output);
}

TEST_F(ConfigTest, MissingGitConfigKeyIsNullopt) {
    EXPECT_FALSE(git_config_value("pstage-no-such-git", "/", "pstage.output").has_value());
}

TEST_F(ConfigTest, RepoRootNeedsWorkingGit) {
    EXPECT_THROW(resolve_repo_root("pstage-no-such-git", "/"), GitError);
}
