#include "async_staging.hpp"
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

shared_ptr<mutex> repository_lock(const string& repo_root) {
    static mutex registry_mutex;
    // weak entries: a root's mutex lives as long as some service holds it
    static unordered_map<string, weak_ptr<mutex>> registry;

    error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(repo_root), ec);
    string key = ec ? repo_root : canonical.lexically_normal().string();

    lock_guard<mutex> guard(registry_mutex);
    shared_ptr<mutex> lock = registry[key].lock();
    if (!lock) {
        for (auto it = registry.begin(); it != registry.end();) {
            if (it->second.expired() && it->first != key) {
                it = registry.erase(it);
            } else {
                ++it;
            }
        }
        lock = make_shared<mutex>();
        registry[key] = lock;
    }
    return lock;
}

AsyncStagingService::AsyncStagingService(StagingService& staging, const string& repo_root)
    : staging(staging), repo_lock(repository_lock(repo_root)) {}

future<StagingResult> AsyncStagingService::run_locked(function<StagingResult(StagingService&)> op) {
    shared_ptr<mutex> lock = this->repo_lock;
    StagingService& staging = this->staging;
    return std::async(std::launch::async, [lock, &staging, op]() {
        lock_guard<mutex> guard(*lock);
        return op(staging);
    });
}

future<optional<FileDiff>> AsyncStagingService::async_file_diff(const string& filepath, bool staged) {
    shared_ptr<mutex> lock = this->repo_lock;
    StagingService& staging = this->staging;
    return std::async(std::launch::async, [lock, &staging, filepath, staged]() {
        lock_guard<mutex> guard(*lock);
        return staging.get_file_diff(filepath, staged);
    });
}

future<StagingResult> AsyncStagingService::async_stage_hunk(const string& filepath, int hunk_index) {
    return this->run_locked([filepath, hunk_index](StagingService& s) {
        return s.stage_hunk(filepath, hunk_index);
    });
}

future<StagingResult> AsyncStagingService::async_unstage_hunk(const string& filepath, int hunk_index) {
    return this->run_locked([filepath, hunk_index](StagingService& s) {
        return s.unstage_hunk(filepath, hunk_index);
    });
}

future<StagingResult> AsyncStagingService::async_discard_hunk(const string& filepath, int hunk_index) {
    return this->run_locked([filepath, hunk_index](StagingService& s) {
        return s.discard_hunk(filepath, hunk_index);
    });
}

future<StagingResult> AsyncStagingService::async_stage_lines(const string& filepath, int hunk_index,
                                                             const vector<int>& line_indices) {
    return this->run_locked([filepath, hunk_index, line_indices](StagingService& s) {
        return s.stage_lines(filepath, hunk_index, line_indices);
    });
}

future<StagingResult> AsyncStagingService::async_unstage_lines(const string& filepath, int hunk_index,
                                                               const vector<int>& line_indices) {
    return this->run_locked([filepath, hunk_index, line_indices](StagingService& s) {
        return s.unstage_lines(filepath, hunk_index, line_indices);
    });
}

future<StagingResult> AsyncStagingService::async_discard_lines(const string& filepath, int hunk_index,
                                                               const vector<int>& line_indices) {
    return this->run_locked([filepath, hunk_index, line_indices](StagingService& s) {
        return s.discard_lines(filepath, hunk_index, line_indices);
    });
}
