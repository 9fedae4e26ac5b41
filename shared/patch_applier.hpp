#ifndef PATCH_APPLIER_HPP
#define PATCH_APPLIER_HPP

#include <string>
#include <vector>
#include "staging_result.hpp"
using namespace std;

enum ApplyTarget {
    APPLY_TO_WORKING_TREE,
    APPLY_TO_INDEX
};

enum ApplyDirection {
    APPLY_FORWARD,
    APPLY_REVERSE
};

struct ApplyRequest {
    string patch;
    ApplyTarget target = APPLY_TO_WORKING_TREE;
    ApplyDirection direction = APPLY_FORWARD;

    vector<string> flags() const;
};

struct ApplyResponse {
    int exit_code = 0;
    string diagnostics;
};

// Request/response boundary around the external patch-apply tool.
class PatchApplier {
public:
    virtual ~PatchApplier() = default;
    virtual ApplyResponse apply(const ApplyRequest& request) = 0;
};

class GitPatchApplier : public PatchApplier {
private:
    string repo_root;
    string git_binary;
    int verbose;
public:
    GitPatchApplier(const string& repo_root, const string& git_binary = "git", int verbose = 0);
    ApplyResponse apply(const ApplyRequest& request) override;
};

// No retry and no fallback strategy: a non-zero exit is returned as a failure
// carrying the tool's own diagnostics.
StagingResult apply_patch(PatchApplier& applier, const string& patch, ApplyTarget target,
                          ApplyDirection direction, const string& success_message);

#endif // PATCH_APPLIER_HPP
