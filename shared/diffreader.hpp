#ifndef DIFFREADER_HPP
#define DIFFREADER_HPP

#include <iostream>
#include <optional>
#include <string>
#include <regex>
#include <variant>
#include <vector>
using namespace std;

// Order matches the alternatives of LineKind.
enum DiffMode {
    EQ = 0,
    INSERTION = 1,
    DELETION = 2
};

struct ContextLine {
    int old_line_num = 0;
    int new_line_num = 0;
};
struct AddLine {
    int new_line_num = 0;
};
struct DeleteLine {
    int old_line_num = 0;
};
typedef variant<ContextLine, AddLine, DeleteLine> LineKind;

struct DiffLine {
    LineKind kind;
    string content;
    int line_index = 0;
    bool no_newline = false;  // followed by "\ No newline at end of file"

    DiffMode mode() const { return static_cast<DiffMode>(kind.index()); }
    optional<int> oldLineNumber() const;
    optional<int> newLineNumber() const;
};

struct DiffHunk {
    string header;
    int old_start = 0;
    int old_lines = 0;
    int new_start = 0;
    int new_lines = 0;
    vector<DiffLine> lines;
    // file header + hunk header + hunk body, applicable on its own
    string raw_patch;
};

enum FileStatus {
    STATUS_ADDED,
    STATUS_MODIFIED,
    STATUS_DELETED,
    STATUS_RENAMED,
    STATUS_UNTRACKED
};

struct FileDiff {
    string filepath;
    optional<string> old_filepath;
    FileStatus status = STATUS_MODIFIED;
    string file_mode = "100644";  // from "new file mode" / "deleted file mode"
    bool is_binary = false;
    int additions = 0;
    int deletions = 0;
    vector<DiffHunk> hunks;
};

const char* fileStatusName(FileStatus status);

/**
 * Reads the unified diff of a single file into a FileDiff.
 *
 * Lines that do not fit the grammar are skipped, the rest of the diff is
 * still returned.
 */
class DiffReader {
private:
    istream& in;
    bool verbose;

    regex hunk_header_regex;

    FileDiff file;
    string file_header;
    bool in_hunk;
    string hunk_raw;
    int old_line_num;
    int new_line_num;
    int old_remaining;
    int new_remaining;

    void ingestDiffLine(const string& line);
    void ingestHunkLine(const string& line);
    void finishHunk();

public:
    DiffReader(istream& in, const string& filepath, bool verbose = false);
    void ingestDiff();
    FileDiff getFileDiff() const;
};

FileDiff parseDiff(const string& diff_text, const string& filepath, bool verbose = false);
FileDiff synthesizeUntrackedDiff(const string& filepath, const string& content);

#endif // DIFFREADER_HPP
