#ifndef ASYNC_STAGING_HPP
#define ASYNC_STAGING_HPP

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "staging.hpp"
using namespace std;

/**
 * Runs StagingService operations on their own thread.
 *
 * Mutating operations on the same repository root hold a shared per-root
 * mutex for the whole fetch/synthesize/apply pipeline, so two calls never
 * interleave on one index or working tree. Reads take the same lock so they
 * never observe a half-applied state. There is no cancellation and no
 * timeout: a hung git blocks its future.
 */
class AsyncStagingService {
private:
    StagingService& staging;
    shared_ptr<mutex> repo_lock;

    future<StagingResult> run_locked(function<StagingResult(StagingService&)> op);

public:
    AsyncStagingService(StagingService& staging, const string& repo_root);

    future<optional<FileDiff>> async_file_diff(const string& filepath, bool staged);

    future<StagingResult> async_stage_hunk(const string& filepath, int hunk_index);
    future<StagingResult> async_unstage_hunk(const string& filepath, int hunk_index);
    future<StagingResult> async_discard_hunk(const string& filepath, int hunk_index);

    future<StagingResult> async_stage_lines(const string& filepath, int hunk_index, const vector<int>& line_indices);
    future<StagingResult> async_unstage_lines(const string& filepath, int hunk_index, const vector<int>& line_indices);
    future<StagingResult> async_discard_lines(const string& filepath, int hunk_index, const vector<int>& line_indices);
};

// One mutex per canonical repository root, shared by every caller in the
// process while any of them still holds it.
shared_ptr<mutex> repository_lock(const string& repo_root);

#endif // ASYNC_STAGING_HPP
