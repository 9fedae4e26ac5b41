#include "utils.hpp"
#include <sstream>

using json = nlohmann::json;

// far beyond any real hunk
static const long long MAX_RANGE_LENGTH = 100000;

static const char* lineTypeName(DiffMode mode) {
    switch (mode) {
        case EQ:        return "context";
        case INSERTION: return "add";
        case DELETION:  return "delete";
    }
    return "context";
}

json to_json(const DiffLine& line) {
    json j = {
        {"type", lineTypeName(line.mode())},
        {"content", line.content},
        {"lineIndex", line.line_index}
    };
    if (optional<int> old_num = line.oldLineNumber()) {
        j["oldLineNumber"] = *old_num;
    }
    if (optional<int> new_num = line.newLineNumber()) {
        j["newLineNumber"] = *new_num;
    }
    if (line.no_newline) {
        j["noNewline"] = true;
    }
    return j;
}

json to_json(const DiffHunk& hunk) {
    json lines = json::array();
    for (const DiffLine& line : hunk.lines) {
        lines.push_back(to_json(line));
    }
    return json{
        {"header", hunk.header},
        {"oldStart", hunk.old_start},
        {"oldLines", hunk.old_lines},
        {"newStart", hunk.new_start},
        {"newLines", hunk.new_lines},
        {"lines", lines},
        {"rawPatch", hunk.raw_patch}
    };
}

json to_json(const FileDiff& diff) {
    json hunks = json::array();
    for (const DiffHunk& hunk : diff.hunks) {
        hunks.push_back(to_json(hunk));
    }
    json j = {
        {"filePath", diff.filepath},
        {"status", fileStatusName(diff.status)},
        {"isBinary", diff.is_binary},
        {"additions", diff.additions},
        {"deletions", diff.deletions},
        {"hunks", hunks}
    };
    if (diff.old_filepath) {
        j["oldPath"] = *diff.old_filepath;
    }
    return j;
}

json to_json(const StagingResult& result) {
    json j = {
        {"success", result.success},
        {"message", result.message}
    };
    if (!result.success) {
        j["error"] = errorKindName(result.error);
    }
    return j;
}

json to_json(const WorkingStatus& status) {
    json files = json::array();
    for (const UncommittedFile& file : status.files) {
        files.push_back({
            {"path", file.path},
            {"status", fileStatusName(file.status)},
            {"staged", file.staged}
        });
    }
    return json{
        {"hasChanges", status.has_changes()},
        {"files", files},
        {"stagedCount", status.staged_count},
        {"unstagedCount", status.unstaged_count},
        {"additions", status.additions},
        {"deletions", status.deletions}
    };
}

int parse_index(const string& value) {
    size_t used = 0;
    int index = 0;
    try {
        index = stoi(value, &used);
    } catch (const exception& e) {
        throw invalid_argument("Not an index: '" + value + "'");
    }
    if (used != value.size() || index < 0) {
        throw invalid_argument("Not an index: '" + value + "'");
    }
    return index;
}

vector<int> parse_line_selection(const string& selection) {
    vector<int> indices;

    size_t first = selection.find_first_not_of(" \t");
    if (first != string::npos && selection[first] == '[') {
        try {
            json j = json::parse(selection);
            indices = j.get<vector<int>>();
        } catch (json::exception& e) {
            throw invalid_argument("Invalid line selection " + selection + ": " + e.what());
        }
        for (int index : indices) {
            if (index < 0) {
                throw invalid_argument("Negative line index in " + selection);
            }
        }
        return indices;
    }

    stringstream ss(selection);
    string part;
    while (getline(ss, part, ',')) {
        size_t start = part.find_first_not_of(" \t");
        if (start == string::npos) {
            continue;
        }
        part = part.substr(start, part.find_last_not_of(" \t") - start + 1);
        size_t dash = part.find('-', 1);
        if (dash == string::npos) {
            indices.push_back(parse_index(part));
            continue;
        }
        int from = parse_index(part.substr(0, dash));
        int to = parse_index(part.substr(dash + 1));
        if (to < from) {
            throw invalid_argument("Invalid line range " + part);
        }
        if (static_cast<long long>(to) - from >= MAX_RANGE_LENGTH) {
            throw invalid_argument("Line range " + part + " is too large");
        }
        for (long long i = from; i <= to; i++) {
            indices.push_back(static_cast<int>(i));
        }
    }
    return indices;
}

static string lineNumber(optional<int> num) {
    string s = num ? to_string(*num) : "";
    if (s.size() < 5) {
        s.insert(0, 5 - s.size(), ' ');
    }
    return s;
}

string format_file_diff(const FileDiff& diff) {
    stringstream out;
    out << diff.filepath << " (" << fileStatusName(diff.status);
    if (diff.old_filepath) {
        out << " from " << *diff.old_filepath;
    }
    out << ", +" << diff.additions << " -" << diff.deletions << ")\n";

    if (diff.is_binary) {
        out << "  binary file\n";
        return out.str();
    }

    for (size_t h = 0; h < diff.hunks.size(); h++) {
        const DiffHunk& hunk = diff.hunks[h];
        out << "hunk " << h << ": " << hunk.header << "\n";
        for (const DiffLine& line : hunk.lines) {
            char marker = line.mode() == INSERTION ? '+' : line.mode() == DELETION ? '-' : ' ';
            out << "  [" << line.line_index << "]"
                << lineNumber(line.oldLineNumber()) << lineNumber(line.newLineNumber())
                << " " << marker << line.content << "\n";
        }
    }
    return out.str();
}

string format_working_status(const WorkingStatus& status) {
    stringstream out;
    if (!status.has_changes()) {
        out << "nothing to commit, working tree clean\n";
        return out.str();
    }
    for (const UncommittedFile& file : status.files) {
        out << (file.staged ? "staged   " : "unstaged ") << fileStatusName(file.status) << "\t" << file.path << "\n";
    }
    out << status.staged_count << " staged, " << status.unstaged_count << " unstaged, +"
        << status.additions << " -" << status.deletions << "\n";
    return out.str();
}
