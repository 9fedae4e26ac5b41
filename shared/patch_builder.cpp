#include "patch_builder.hpp"

static const string NO_NEWLINE_MARKER = "\\ No newline at end of file";

LinePatch buildLinePatch(const DiffHunk& hunk, const set<int>& selected_lines, PatchDirection direction) {
    LinePatch patch;
    patch.old_start = hunk.old_start;
    patch.new_start = hunk.new_start;

    for (const DiffLine& line : hunk.lines) {
        bool selected = selected_lines.count(line.line_index) > 0;
        char marker = 0;

        switch (line.mode()) {
            case EQ:
                marker = ' ';
                break;
            case INSERTION:
                if (selected)                         marker = '+';
                else if (direction == PATCH_REVERSE) marker = ' ';
                break;
            case DELETION:
                if (selected)                         marker = '-';
                else if (direction == PATCH_FORWARD) marker = ' ';
                break;
        }

        if (marker == 0) {
            continue;
        }
        if (marker == ' ')      { patch.old_count++; patch.new_count++; }
        else if (marker == '-') { patch.old_count++; }
        else if (marker == '+') { patch.new_count++; }

        patch.body.push_back(string(1, marker) + line.content);
        if (line.no_newline) {
            patch.body.push_back(NO_NEWLINE_MARKER);
        }
    }

    // git reads "-0,N" with N > 0 as a hunk before the first line
    if (patch.old_start == 0 && patch.old_count > 0) {
        patch.old_start = 1;
    }
    if (patch.new_start == 0 && patch.new_count > 0) {
        patch.new_start = 1;
    }

    return patch;
}

string hunkHeader(const LinePatch& patch) {
    return "@@ -" + to_string(patch.old_start) + "," + to_string(patch.old_count) +
           " +" + to_string(patch.new_start) + "," + to_string(patch.new_count) + " @@";
}

FileHeaderKind fileHeaderKind(FileStatus status, const LinePatch& patch) {
    if ((status == STATUS_ADDED || status == STATUS_UNTRACKED) && patch.old_count == 0) {
        return HEADER_NEW_FILE;
    }
    if (status == STATUS_DELETED && patch.new_count == 0) {
        return HEADER_DELETED_FILE;
    }
    return HEADER_MODIFIED;
}

string fileHeader(const string& filepath, FileHeaderKind kind, const string& file_mode) {
    string header = "diff --git a/" + filepath + " b/" + filepath + "\n";
    switch (kind) {
        case HEADER_NEW_FILE:
            header += "new file mode " + file_mode + "\n";
            header += "--- /dev/null\n";
            header += "+++ b/" + filepath + "\n";
            break;
        case HEADER_DELETED_FILE:
            header += "deleted file mode " + file_mode + "\n";
            header += "--- a/" + filepath + "\n";
            header += "+++ /dev/null\n";
            break;
        case HEADER_MODIFIED:
            header += "--- a/" + filepath + "\n";
            header += "+++ b/" + filepath + "\n";
            break;
    }
    return header;
}

string renderLinePatch(const string& filepath, const LinePatch& patch, FileHeaderKind kind, const string& file_mode) {
    string text = fileHeader(filepath, kind, file_mode);
    text += hunkHeader(patch) + "\n";
    for (const string& line : patch.body) {
        text += line + "\n";
    }
    return text;
}

string createLinePatch(const string& filepath, const DiffHunk& hunk, const set<int>& selected_lines,
                       PatchDirection direction, FileStatus status, const string& file_mode) {
    LinePatch patch = buildLinePatch(hunk, selected_lines, direction);
    return renderLinePatch(filepath, patch, fileHeaderKind(status, patch), file_mode);
}
