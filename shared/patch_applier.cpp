#include "patch_applier.hpp"
#include "process.hpp"
#include <iostream>

vector<string> ApplyRequest::flags() const {
    vector<string> flags;
    if (this->target == APPLY_TO_INDEX) {
        flags.push_back("--cached");
    }
    if (this->direction == APPLY_REVERSE) {
        flags.push_back("--reverse");
    }
    return flags;
}

GitPatchApplier::GitPatchApplier(const string& repo_root, const string& git_binary, int verbose)
    : repo_root(repo_root), git_binary(git_binary), verbose(verbose) {}

ApplyResponse GitPatchApplier::apply(const ApplyRequest& request) {
    vector<string> argv = {this->git_binary, "apply"};
    for (const string& flag : request.flags()) {
        argv.push_back(flag);
    }

    if (this->verbose >= 1) {
        cerr << "Running: " << describe_command(argv) << endl;
    }
    if (this->verbose >= 2) {
        cerr << request.patch;
    }

    ProcessResult proc = run_process(argv, this->repo_root, request.patch);

    ApplyResponse response;
    response.exit_code = proc.exit_code;
    response.diagnostics = proc.err.empty() ? proc.out : proc.err;

    if (this->verbose >= 1) {
        cerr << "git apply exited with " << proc.exit_code << endl;
    }
    return response;
}

StagingResult apply_patch(PatchApplier& applier, const string& patch, ApplyTarget target,
                          ApplyDirection direction, const string& success_message) {
    ApplyRequest request;
    request.patch = patch;
    request.target = target;
    request.direction = direction;

    ApplyResponse response = applier.apply(request);
    if (response.exit_code != 0) {
        string message = response.diagnostics;
        if (message.empty()) {
            message = "git apply exited with code " + to_string(response.exit_code);
        }
        return StagingResult::fail(message, ERROR_APPLY);
    }
    return StagingResult::ok(success_message);
}
