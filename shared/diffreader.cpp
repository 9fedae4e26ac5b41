#include "diffreader.hpp"
#include <sstream>

optional<int> DiffLine::oldLineNumber() const {
    if (const ContextLine* ctx = get_if<ContextLine>(&this->kind)) {
        return ctx->old_line_num;
    }
    if (const DeleteLine* del = get_if<DeleteLine>(&this->kind)) {
        return del->old_line_num;
    }
    return nullopt;
}

optional<int> DiffLine::newLineNumber() const {
    if (const ContextLine* ctx = get_if<ContextLine>(&this->kind)) {
        return ctx->new_line_num;
    }
    if (const AddLine* add = get_if<AddLine>(&this->kind)) {
        return add->new_line_num;
    }
    return nullopt;
}

const char* fileStatusName(FileStatus status) {
    switch (status) {
        case STATUS_ADDED:     return "added";
        case STATUS_MODIFIED:  return "modified";
        case STATUS_DELETED:   return "deleted";
        case STATUS_RENAMED:   return "renamed";
        case STATUS_UNTRACKED: return "untracked";
    }
    return "modified";
}

static bool startsWith(const string& line, const string& prefix) {
    return line.compare(0, prefix.size(), prefix) == 0;
}

DiffReader::DiffReader(istream& in, const string& filepath, bool verbose)
    : in(in),
      verbose(verbose),
      hunk_header_regex(regex("^@@ -(\\d+)(?:,(\\d+))? \\+(\\d+)(?:,(\\d+))? @@(.*)$")),
      in_hunk(false),
      old_line_num(0),
      new_line_num(0),
      old_remaining(0),
      new_remaining(0)
{
    this->file.filepath = filepath;
}

FileDiff DiffReader::getFileDiff() const {
    return this->file;
}

void DiffReader::finishHunk() {
    if (!this->in_hunk) {
        return;
    }
    this->file.hunks.back().raw_patch = this->file_header + this->hunk_raw;
    this->hunk_raw.clear();
    this->in_hunk = false;
}

void DiffReader::ingestHunkLine(const string& line) {
    DiffHunk& hunk = this->file.hunks.back();

    DiffLine dline;
    dline.content = line.substr(1);
    dline.line_index = static_cast<int>(hunk.lines.size());

    if (line[0] == '+') {
        dline.kind = AddLine{this->new_line_num++};
        this->new_remaining--;
        this->file.additions++;
    } else if (line[0] == '-') {
        dline.kind = DeleteLine{this->old_line_num++};
        this->old_remaining--;
        this->file.deletions++;
    } else {
        dline.kind = ContextLine{this->old_line_num++, this->new_line_num++};
        this->old_remaining--;
        this->new_remaining--;
    }

    if (this->verbose) {
        cerr << "LINE " << dline.line_index << " (" << line[0] << "): " << dline.content << endl;
    }

    hunk.lines.push_back(dline);
    this->hunk_raw += line + "\n";
}

void DiffReader::ingestDiffLine(const string& line) {
    smatch match;

    if (regex_match(line, match, this->hunk_header_regex)) {
        this->finishHunk();

        DiffHunk hunk;
        hunk.header = line;
        hunk.old_start = stoi(match[1].str());
        hunk.old_lines = match[2].matched ? stoi(match[2].str()) : 1;
        hunk.new_start = stoi(match[3].str());
        hunk.new_lines = match[4].matched ? stoi(match[4].str()) : 1;

        this->old_line_num = hunk.old_start;
        this->new_line_num = hunk.new_start;
        this->old_remaining = hunk.old_lines;
        this->new_remaining = hunk.new_lines;

        this->file.hunks.push_back(hunk);
        this->hunk_raw = line + "\n";
        this->in_hunk = true;

        if (this->verbose) {
            cerr << "NEW HUNK: " << line << endl;
        }
        return;
    }

    if (this->in_hunk) {
        if (line.empty()) {
            return;
        }
        char marker = line[0];
        bool within_counts = this->old_remaining > 0 || this->new_remaining > 0;

        if (marker == '\\') {
            DiffHunk& hunk = this->file.hunks.back();
            if (!hunk.lines.empty()) {
                hunk.lines.back().no_newline = true;
            }
            this->hunk_raw += line + "\n";
            return;
        }
        if (within_counts && (marker == '+' || marker == '-' || marker == ' ')) {
            this->ingestHunkLine(line);
            return;
        }
        if ((marker == '+' && !startsWith(line, "+++")) ||
            (marker == '-' && !startsWith(line, "---")) ||
            marker == ' ') {
            this->ingestHunkLine(line);
            return;
        }

        if (this->verbose) {
            cerr << "SKIPPED LINE: " << line << endl;
        }
        return;
    }

    if (startsWith(line, "Binary files ") || startsWith(line, "GIT binary patch")) {
        this->file.is_binary = true;
    } else if (startsWith(line, "new file mode ")) {
        this->file.status = STATUS_ADDED;
        this->file.file_mode = line.substr(14);
    } else if (startsWith(line, "deleted file mode ")) {
        this->file.status = STATUS_DELETED;
        this->file.file_mode = line.substr(18);
    } else if (startsWith(line, "rename from ")) {
        this->file.old_filepath = line.substr(12);
        this->file.status = STATUS_RENAMED;
    }
    this->file_header += line + "\n";
}

void DiffReader::ingestDiff() {
    string line;
    while (getline(this->in, line)) {
        this->ingestDiffLine(line);
    }
    this->finishHunk();

    if (this->file.is_binary) {
        this->file.hunks.clear();
    }
}

FileDiff parseDiff(const string& diff_text, const string& filepath, bool verbose) {
    istringstream input(diff_text);
    DiffReader dr(input, filepath, verbose);
    dr.ingestDiff();
    return dr.getFileDiff();
}

FileDiff synthesizeUntrackedDiff(const string& filepath, const string& content) {
    FileDiff file;
    file.filepath = filepath;
    file.status = STATUS_UNTRACKED;

    if (content.find('\0') != string::npos) {
        file.is_binary = true;
        return file;
    }

    vector<string> contents;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == string::npos) {
            contents.push_back(content.substr(pos));
            break;
        }
        contents.push_back(content.substr(pos, end - pos));
        pos = end + 1;
    }
    if (contents.empty()) {
        return file;
    }

    int count = static_cast<int>(contents.size());
    DiffHunk hunk;
    hunk.header = "@@ -0,0 +1," + to_string(count) + " @@";
    hunk.old_start = 0;
    hunk.old_lines = 0;
    hunk.new_start = 1;
    hunk.new_lines = count;

    hunk.raw_patch = "diff --git a/" + filepath + " b/" + filepath + "\n";
    hunk.raw_patch += "new file mode 100644\n";
    hunk.raw_patch += "--- /dev/null\n";
    hunk.raw_patch += "+++ b/" + filepath + "\n";
    hunk.raw_patch += hunk.header + "\n";

    for (int i = 0; i < count; i++) {
        DiffLine dline;
        dline.kind = AddLine{i + 1};
        dline.content = contents[i];
        dline.line_index = i;
        hunk.lines.push_back(dline);
        hunk.raw_patch += "+" + contents[i] + "\n";
    }
    if (content.back() != '\n') {
        hunk.lines.back().no_newline = true;
        hunk.raw_patch += "\\ No newline at end of file\n";
    }

    file.additions = count;
    file.hunks.push_back(hunk);
    return file;
}
