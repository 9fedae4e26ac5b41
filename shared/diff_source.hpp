#ifndef DIFF_SOURCE_HPP
#define DIFF_SOURCE_HPP

#include <string>
#include <vector>
#include "staging_result.hpp"
using namespace std;

// Where raw diffs and working tree contents come from.
class DiffSource {
public:
    virtual ~DiffSource() = default;
    // staged: index against HEAD, otherwise working tree against index
    virtual string diff(const string& filepath, bool staged) = 0;
    virtual bool is_untracked(const string& filepath) = 0;
    virtual string read_file(const string& filepath) = 0;
};

class GitDiffSource : public DiffSource {
private:
    string repo_root;
    string git_binary;
    int verbose;

    string run_git(const vector<string>& args);
public:
    GitDiffSource(const string& repo_root, const string& git_binary = "git", int verbose = 0);
    string diff(const string& filepath, bool staged) override;
    bool is_untracked(const string& filepath) override;
    string read_file(const string& filepath) override;
};

// Throws ValidationError for absolute paths and paths that leave the repository.
void check_repo_relative(const string& filepath);

#endif // DIFF_SOURCE_HPP
