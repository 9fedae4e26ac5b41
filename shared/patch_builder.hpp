#ifndef PATCH_BUILDER_HPP
#define PATCH_BUILDER_HPP

#include <set>
#include <string>
#include <vector>
#include "diffreader.hpp"
using namespace std;

enum PatchDirection {
    PATCH_FORWARD,  // applied as-is, to the side the diff started from
    PATCH_REVERSE   // applied with --reverse, to the side the diff ended at
};

// Which side of the patch, if any, is /dev/null.
enum FileHeaderKind {
    HEADER_MODIFIED,
    HEADER_NEW_FILE,      // --- /dev/null
    HEADER_DELETED_FILE   // +++ /dev/null
};

struct LinePatch {
    int old_start = 0;
    int old_count = 0;
    int new_start = 0;
    int new_count = 0;
    vector<string> body;  // emitted lines, marker column included
};

/**
 * Keeps the selected add/delete lines of a hunk and rewrites the rest so the
 * result still applies.
 *
 * Forward: unselected additions are dropped, unselected deletions become
 * context. Reverse: unselected additions become context, unselected deletions
 * are dropped. Start offsets are copied from the hunk, counts are recomputed.
 */
LinePatch buildLinePatch(const DiffHunk& hunk, const set<int>& selected_lines, PatchDirection direction = PATCH_FORWARD);

string hunkHeader(const LinePatch& patch);

// A creation or deletion header is only emitted when the patch empties the
// side that does not exist for a file of this status, so that selecting every
// line of an added or deleted file gives the same effect as its raw patch.
FileHeaderKind fileHeaderKind(FileStatus status, const LinePatch& patch);

string fileHeader(const string& filepath, FileHeaderKind kind = HEADER_MODIFIED, const string& file_mode = "100644");
string renderLinePatch(const string& filepath, const LinePatch& patch, FileHeaderKind kind = HEADER_MODIFIED,
                       const string& file_mode = "100644");
string createLinePatch(const string& filepath, const DiffHunk& hunk, const set<int>& selected_lines,
                       PatchDirection direction = PATCH_FORWARD, FileStatus status = STATUS_MODIFIED,
                       const string& file_mode = "100644");

#endif // PATCH_BUILDER_HPP
