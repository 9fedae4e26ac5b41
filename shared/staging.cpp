#include "staging.hpp"
#include <iostream>

const char* errorKindName(ErrorKind error) {
    switch (error) {
        case ERROR_NONE:       return "none";
        case ERROR_VALIDATION: return "validation";
        case ERROR_APPLY:      return "apply";
        case ERROR_IO:         return "io";
        case ERROR_GIT:        return "git";
    }
    return "git";
}

const char* stagingOpName(StagingOp op) {
    switch (op) {
        case OP_STAGE:   return "stage";
        case OP_UNSTAGE: return "unstage";
        case OP_DISCARD: return "discard";
    }
    return "stage";
}

static const char* pastTense(StagingOp op) {
    switch (op) {
        case OP_STAGE:   return "Staged";
        case OP_UNSTAGE: return "Unstaged";
        case OP_DISCARD: return "Discarded";
    }
    return "Staged";
}

static ApplyTarget targetFor(StagingOp op) {
    return op == OP_DISCARD ? APPLY_TO_WORKING_TREE : APPLY_TO_INDEX;
}

static ApplyDirection directionFor(StagingOp op) {
    return op == OP_STAGE ? APPLY_FORWARD : APPLY_REVERSE;
}

StagingService::StagingService(DiffSource& source, PatchApplier& applier, int verbose)
    : source(source), applier(applier), verbose(verbose) {}

optional<FileDiff> StagingService::load_diff(const string& filepath, bool staged) {
    string text = this->source.diff(filepath, staged);

    if (text.find_first_not_of(" \t\r\n") == string::npos) {
        // untracked files never show up in git diff
        if (!staged && this->source.is_untracked(filepath)) {
            if (this->verbose >= 1) {
                cerr << filepath << " is untracked, synthesizing an addition hunk" << endl;
            }
            return synthesizeUntrackedDiff(filepath, this->source.read_file(filepath));
        }
        return nullopt;
    }

    return parseDiff(text, filepath, this->verbose >= 2);
}

optional<FileDiff> StagingService::get_file_diff(const string& filepath, bool staged) {
    try {
        return this->load_diff(filepath, staged);
    } catch (const exception& e) {
        cerr << "Error getting file diff for " << filepath << ": " << e.what() << endl;
        return nullopt;
    }
}

FileDiff StagingService::fetch_for(StagingOp op, const string& filepath) {
    bool staged = op == OP_UNSTAGE;
    optional<FileDiff> diff = this->load_diff(filepath, staged);
    if (!diff) {
        throw ValidationError(string("No ") + (staged ? "staged" : "unstaged") + " changes in " + filepath);
    }
    return *diff;
}

const DiffHunk& StagingService::select_hunk(const FileDiff& diff, int hunk_index) {
    if (diff.is_binary) {
        throw ValidationError("Binary file " + diff.filepath + " can only be staged or discarded as a whole");
    }
    int count = static_cast<int>(diff.hunks.size());
    if (hunk_index < 0 || hunk_index >= count) {
        throw ValidationError("Hunk index " + to_string(hunk_index) + " is out of range (" +
                              diff.filepath + " has " + to_string(count) + " hunks)");
    }
    const DiffHunk& hunk = diff.hunks[hunk_index];
    if (hunk.raw_patch.empty()) {
        throw ValidationError("Hunk " + to_string(hunk_index) + " of " + diff.filepath + " has no patch text");
    }
    return hunk;
}

StagingResult StagingService::run_hunk_op(StagingOp op, const string& filepath, int hunk_index) {
    if (this->verbose >= 1) {
        cerr << stagingOpName(op) << " hunk " << hunk_index << " of " << filepath << endl;
    }

    try {
        FileDiff diff = this->fetch_for(op, filepath);
        const DiffHunk& hunk = this->select_hunk(diff, hunk_index);

        string message = string(pastTense(op)) + " hunk " + to_string(hunk_index + 1) + " of " +
                         to_string(diff.hunks.size()) + " in " + filepath;
        return apply_patch(this->applier, hunk.raw_patch, targetFor(op), directionFor(op), message);
    } catch (const ValidationError& e) {
        return StagingResult::fail(e.what(), ERROR_VALIDATION);
    } catch (const IOFailure& e) {
        return StagingResult::fail(e.what(), ERROR_IO);
    } catch (const exception& e) {
        return StagingResult::fail(e.what(), ERROR_GIT);
    }
}

StagingResult StagingService::run_lines_op(StagingOp op, const string& filepath, int hunk_index,
                                           const vector<int>& line_indices) {
    if (this->verbose >= 1) {
        cerr << stagingOpName(op) << " " << line_indices.size() << " lines of hunk " << hunk_index
             << " of " << filepath << endl;
    }
    if (line_indices.empty()) {
        return StagingResult::fail("No lines selected", ERROR_VALIDATION);
    }

    try {
        FileDiff diff = this->fetch_for(op, filepath);
        const DiffHunk& hunk = this->select_hunk(diff, hunk_index);

        set<int> selected;
        int changed = 0;
        for (int index : line_indices) {
            if (index < 0 || index >= static_cast<int>(hunk.lines.size())) {
                throw ValidationError("Line index " + to_string(index) + " is out of range (hunk has " +
                                      to_string(hunk.lines.size()) + " lines)");
            }
            if (selected.insert(index).second && hunk.lines[index].mode() != EQ) {
                changed++;
            }
        }
        if (changed == 0) {
            throw ValidationError("Selection contains no added or removed lines");
        }

        PatchDirection direction = op == OP_STAGE ? PATCH_FORWARD : PATCH_REVERSE;
        string patch = createLinePatch(filepath, hunk, selected, direction, diff.status, diff.file_mode);

        if (this->verbose >= 2) {
            cerr << patch;
        }

        string message = string(pastTense(op)) + " " + to_string(changed) +
                         (changed == 1 ? " line" : " lines") + " in " + filepath;
        return apply_patch(this->applier, patch, targetFor(op), directionFor(op), message);
    } catch (const ValidationError& e) {
        return StagingResult::fail(e.what(), ERROR_VALIDATION);
    } catch (const IOFailure& e) {
        return StagingResult::fail(e.what(), ERROR_IO);
    } catch (const exception& e) {
        return StagingResult::fail(e.what(), ERROR_GIT);
    }
}

StagingResult StagingService::stage_hunk(const string& filepath, int hunk_index) {
    return this->run_hunk_op(OP_STAGE, filepath, hunk_index);
}

StagingResult StagingService::unstage_hunk(const string& filepath, int hunk_index) {
    return this->run_hunk_op(OP_UNSTAGE, filepath, hunk_index);
}

StagingResult StagingService::discard_hunk(const string& filepath, int hunk_index) {
    return this->run_hunk_op(OP_DISCARD, filepath, hunk_index);
}

StagingResult StagingService::stage_lines(const string& filepath, int hunk_index, const vector<int>& line_indices) {
    return this->run_lines_op(OP_STAGE, filepath, hunk_index, line_indices);
}

StagingResult StagingService::unstage_lines(const string& filepath, int hunk_index, const vector<int>& line_indices) {
    return this->run_lines_op(OP_UNSTAGE, filepath, hunk_index, line_indices);
}

StagingResult StagingService::discard_lines(const string& filepath, int hunk_index, const vector<int>& line_indices) {
    return this->run_lines_op(OP_DISCARD, filepath, hunk_index, line_indices);
}
