#include "config.hpp"
#include "process.hpp"
#include "staging_result.hpp"
#include <cstdlib>
#include <iostream>

static string trim_newline(string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

optional<string> git_config_value(const string& git_binary, const string& dir, const string& key) {
    try {
        ProcessResult proc = run_process({git_binary, "config", "--get", key}, dir);
        // exit 1 means the key is not set
        if (proc.exit_code != 0) {
            return nullopt;
        }
        return trim_newline(proc.out);
    } catch (const exception& e) {
        cerr << "Could not read git config " << key << ": " << e.what() << endl;
        return nullopt;
    }
}

string resolve_repo_root(const string& git_binary, const string& dir) {
    ProcessResult proc = run_process({git_binary, "rev-parse", "--show-toplevel"}, dir);
    if (proc.exit_code != 0) {
        throw GitError(proc.err.empty() ? "Not a git repository: " + dir : trim_newline(proc.err));
    }
    return trim_newline(proc.out);
}

int parse_verbosity(const string& value) {
    if (value == "true" || value == "yes" || value == "on") {
        return 1;
    }
    if (value == "false" || value == "no" || value == "off" || value.empty()) {
        return 0;
    }
    try {
        int level = stoi(value);
        return level < 0 ? 0 : level;
    } catch (const exception& e) {
        cerr << "Ignoring invalid verbosity '" << value << "'" << endl;
        return 0;
    }
}

StageConfig load_config(const string& start_dir) {
    StageConfig config;
    config.repo_root = start_dir;

    const char* git_env = getenv("PSTAGE_GIT");
    if (git_env && *git_env) {
        config.git_binary = git_env;
    } else if (optional<string> git = git_config_value(config.git_binary, start_dir, "pstage.git")) {
        if (!git->empty()) {
            config.git_binary = *git;
        }
    }

    const char* verbose_env = getenv("PSTAGE_VERBOSE");
    if (verbose_env && *verbose_env) {
        config.verbose = parse_verbosity(verbose_env);
    } else if (optional<string> verbose = git_config_value(config.git_binary, start_dir, "pstage.verbose")) {
        config.verbose = parse_verbosity(*verbose);
    }

    if (optional<string> output = git_config_value(config.git_binary, start_dir, "pstage.output")) {
        config.text_output = *output == "text";
    }

    return config;
}
