#include "diff_source.hpp"
#include "process.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

void check_repo_relative(const string& filepath) {
    if (filepath.empty()) {
        throw ValidationError("No file path given");
    }
    fs::path path(filepath);
    if (path.is_absolute()) {
        throw ValidationError("Path must be relative to the repository root: " + filepath);
    }
    fs::path normal = path.lexically_normal();
    if (!normal.empty() && *normal.begin() == "..") {
        throw ValidationError("Path is outside the repository: " + filepath);
    }
}

GitDiffSource::GitDiffSource(const string& repo_root, const string& git_binary, int verbose)
    : repo_root(repo_root), git_binary(git_binary), verbose(verbose) {}

string GitDiffSource::run_git(const vector<string>& args) {
    vector<string> argv = {this->git_binary};
    argv.insert(argv.end(), args.begin(), args.end());

    if (this->verbose >= 1) {
        cerr << "Running: " << describe_command(argv) << endl;
    }

    ProcessResult proc = run_process(argv, this->repo_root);
    if (proc.exit_code != 0) {
        string message = proc.err.empty() ? describe_command(argv) + " failed" : proc.err;
        throw GitError(message);
    }
    return proc.out;
}

string GitDiffSource::diff(const string& filepath, bool staged) {
    check_repo_relative(filepath);

    vector<string> args = {"diff"};
    if (staged) {
        args.push_back("--staged");
    }
    // pin the output format against user configuration
    args.push_back("--no-color");
    args.push_back("--no-ext-diff");
    args.push_back("--src-prefix=a/");
    args.push_back("--dst-prefix=b/");
    args.push_back("--");
    args.push_back(filepath);
    return this->run_git(args);
}

bool GitDiffSource::is_untracked(const string& filepath) {
    check_repo_relative(filepath);
    string out = this->run_git({"ls-files", "--others", "--exclude-standard", "--", filepath});
    return out.find_first_not_of(" \t\r\n") != string::npos;
}

string GitDiffSource::read_file(const string& filepath) {
    check_repo_relative(filepath);
    fs::path full_path = fs::path(this->repo_root) / filepath;

    ifstream file(full_path, ios::binary);
    if (!file.is_open()) {
        throw IOFailure("Failed to read " + filepath + ": " + strerror(errno));
    }
    stringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw IOFailure("Failed to read " + filepath);
    }
    return content.str();
}
