#ifndef FILE_STAGING_HPP
#define FILE_STAGING_HPP

#include <string>
#include <vector>
#include "diffreader.hpp"
#include "staging_result.hpp"
using namespace std;

struct UncommittedFile {
    string path;
    FileStatus status;
    bool staged;
};

struct WorkingStatus {
    vector<UncommittedFile> files;
    int staged_count = 0;
    int unstaged_count = 0;
    int additions = 0;
    int deletions = 0;

    bool has_changes() const { return !files.empty(); }
};

// Whole-file commands. These hand the path straight to git, no diff parsing.
class FileStaging {
private:
    string repo_root;
    string git_binary;
    int verbose;

    StagingResult run_git(const vector<string>& args, const string& success_message);
public:
    FileStaging(const string& repo_root, const string& git_binary = "git", int verbose = 0);

    StagingResult stage_file(const string& filepath);
    StagingResult unstage_file(const string& filepath);
    StagingResult discard_file_changes(const string& filepath);
    StagingResult stage_all();
    StagingResult unstage_all();

    // Throws GitError when git status fails.
    WorkingStatus get_working_status();
};

// Parses `git status --porcelain=v1 -z` output.
WorkingStatus parseWorkingStatus(const string& porcelain);
// Adds up `git diff --numstat` output; binary entries count as zero.
void addNumstat(const string& numstat, int& additions, int& deletions);

#endif // FILE_STAGING_HPP
