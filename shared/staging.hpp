#ifndef STAGING_HPP
#define STAGING_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "diffreader.hpp"
#include "diff_source.hpp"
#include "patch_applier.hpp"
#include "patch_builder.hpp"
#include "staging_result.hpp"
using namespace std;

enum StagingOp {
    OP_STAGE,    // unstaged diff -> index, forward
    OP_UNSTAGE,  // staged diff -> index, reverse
    OP_DISCARD   // unstaged diff -> working tree, reverse
};

/**
 * Hunk and line granular stage/unstage/discard.
 *
 * Every operation fetches a fresh diff first, so hunk and line indices must
 * come from a diff read after the last mutation. Nothing here serializes
 * concurrent calls on the same repository; see AsyncStagingService.
 */
class StagingService {
private:
    DiffSource& source;
    PatchApplier& applier;
    int verbose;

    optional<FileDiff> load_diff(const string& filepath, bool staged);
    FileDiff fetch_for(StagingOp op, const string& filepath);
    const DiffHunk& select_hunk(const FileDiff& diff, int hunk_index);
    StagingResult run_hunk_op(StagingOp op, const string& filepath, int hunk_index);
    StagingResult run_lines_op(StagingOp op, const string& filepath, int hunk_index, const vector<int>& line_indices);

public:
    StagingService(DiffSource& source, PatchApplier& applier, int verbose = 0);

    // nullopt when the file has no changes on that side or the diff could not be read
    optional<FileDiff> get_file_diff(const string& filepath, bool staged);

    StagingResult stage_hunk(const string& filepath, int hunk_index);
    StagingResult unstage_hunk(const string& filepath, int hunk_index);
    StagingResult discard_hunk(const string& filepath, int hunk_index);

    StagingResult stage_lines(const string& filepath, int hunk_index, const vector<int>& line_indices);
    StagingResult unstage_lines(const string& filepath, int hunk_index, const vector<int>& line_indices);
    StagingResult discard_lines(const string& filepath, int hunk_index, const vector<int>& line_indices);
};

const char* stagingOpName(StagingOp op);

#endif // STAGING_HPP
