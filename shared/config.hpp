#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <optional>
#include <string>
using namespace std;

struct StageConfig {
    string repo_root = ".";
    string git_binary = "git";
    int verbose = 0;
    bool text_output = false;  // JSON unless asked otherwise
};

// Environment (PSTAGE_GIT, PSTAGE_VERBOSE) over git config (pstage.git,
// pstage.verbose, pstage.output) over defaults. Command line flags are applied
// by the caller on top of the result.
StageConfig load_config(const string& start_dir);

optional<string> git_config_value(const string& git_binary, const string& dir, const string& key);

// Top level of the work tree containing dir. Throws GitError outside a repository.
string resolve_repo_root(const string& git_binary, const string& dir);

int parse_verbosity(const string& value);

#endif // CONFIG_HPP
