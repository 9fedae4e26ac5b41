#include "file_staging.hpp"
#include "diff_source.hpp"
#include "process.hpp"
#include <iostream>
#include <sstream>

FileStaging::FileStaging(const string& repo_root, const string& git_binary, int verbose)
    : repo_root(repo_root), git_binary(git_binary), verbose(verbose) {}

StagingResult FileStaging::run_git(const vector<string>& args, const string& success_message) {
    vector<string> argv = {this->git_binary};
    argv.insert(argv.end(), args.begin(), args.end());

    if (this->verbose >= 1) {
        cerr << "Running: " << describe_command(argv) << endl;
    }

    try {
        ProcessResult proc = run_process(argv, this->repo_root);
        if (proc.exit_code != 0) {
            string message = proc.err.empty() ? describe_command(argv) + " failed" : proc.err;
            return StagingResult::fail(message, ERROR_GIT);
        }
    } catch (const exception& e) {
        return StagingResult::fail(e.what(), ERROR_GIT);
    }
    return StagingResult::ok(success_message);
}

StagingResult FileStaging::stage_file(const string& filepath) {
    try {
        check_repo_relative(filepath);
    } catch (const ValidationError& e) {
        return StagingResult::fail(e.what(), ERROR_VALIDATION);
    }
    return this->run_git({"add", "--", filepath}, "Staged " + filepath);
}

StagingResult FileStaging::unstage_file(const string& filepath) {
    try {
        check_repo_relative(filepath);
    } catch (const ValidationError& e) {
        return StagingResult::fail(e.what(), ERROR_VALIDATION);
    }
    return this->run_git({"restore", "--staged", "--", filepath}, "Unstaged " + filepath);
}

StagingResult FileStaging::discard_file_changes(const string& filepath) {
    try {
        check_repo_relative(filepath);
    } catch (const ValidationError& e) {
        return StagingResult::fail(e.what(), ERROR_VALIDATION);
    }
    return this->run_git({"restore", "--", filepath}, "Discarded changes in " + filepath);
}

StagingResult FileStaging::stage_all() {
    return this->run_git({"add", "-A"}, "Staged all changes");
}

StagingResult FileStaging::unstage_all() {
    return this->run_git({"restore", "--staged", "."}, "Unstaged all changes");
}

WorkingStatus FileStaging::get_working_status() {
    vector<string> status_argv = {this->git_binary, "status", "--porcelain=v1", "-z", "--untracked-files=all"};
    if (this->verbose >= 1) {
        cerr << "Running: " << describe_command(status_argv) << endl;
    }
    ProcessResult proc = run_process(status_argv, this->repo_root);
    if (proc.exit_code != 0) {
        throw GitError(proc.err.empty() ? "git status failed" : proc.err);
    }
    WorkingStatus status = parseWorkingStatus(proc.out);

    // line stats are informational, a failure leaves them at zero
    ProcessResult unstaged = run_process({this->git_binary, "diff", "--numstat"}, this->repo_root);
    if (unstaged.exit_code == 0) {
        addNumstat(unstaged.out, status.additions, status.deletions);
    }
    ProcessResult staged = run_process({this->git_binary, "diff", "--cached", "--numstat"}, this->repo_root);
    if (staged.exit_code == 0) {
        addNumstat(staged.out, status.additions, status.deletions);
    }
    return status;
}

static FileStatus indexStatus(char code) {
    switch (code) {
        case 'A': return STATUS_ADDED;
        case 'D': return STATUS_DELETED;
        case 'R': return STATUS_RENAMED;
        default:  return STATUS_MODIFIED;
    }
}

static FileStatus worktreeStatus(char code) {
    switch (code) {
        case '?': return STATUS_UNTRACKED;
        case 'A': return STATUS_ADDED;
        case 'D': return STATUS_DELETED;
        default:  return STATUS_MODIFIED;
    }
}

WorkingStatus parseWorkingStatus(const string& porcelain) {
    vector<string> entries;
    size_t pos = 0;
    while (pos < porcelain.size()) {
        size_t end = porcelain.find('\0', pos);
        if (end == string::npos) {
            end = porcelain.size();
        }
        entries.push_back(porcelain.substr(pos, end - pos));
        pos = end + 1;
    }

    WorkingStatus status;
    for (size_t i = 0; i < entries.size(); i++) {
        const string& entry = entries[i];
        if (entry.size() < 4) {
            continue;
        }
        char x = entry[0];
        char y = entry[1];
        string path = entry.substr(3);

        // renames and copies carry the source path as the next entry
        if (x == 'R' || x == 'C' || y == 'R' || y == 'C') {
            i++;
        }

        if (x != ' ' && x != '?' && x != '!') {
            status.files.push_back({path, indexStatus(x), true});
            status.staged_count++;
        }
        if (y != ' ' && y != '!') {
            status.files.push_back({path, worktreeStatus(y), false});
            status.unstaged_count++;
        }
    }
    return status;
}

void addNumstat(const string& numstat, int& additions, int& deletions) {
    istringstream input(numstat);
    string line;
    while (getline(input, line)) {
        istringstream fields(line);
        string added, removed;
        if (!(fields >> added >> removed) || added == "-" || removed == "-") {
            continue;
        }
        try {
            additions += stoi(added);
            deletions += stoi(removed);
        } catch (const exception& e) {
            cerr << "Unexpected numstat line: " << line << endl;
        }
    }
}
