#include "config.hpp"
#include "diff_source.hpp"
#include "file_staging.hpp"
#include "patch_applier.hpp"
#include "staging.hpp"
#include "utils.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using json = nlohmann::json;

static void print_usage(const char* prog) {
  cerr << "Usage: " << prog << " [-C dir] [-v|-vv] [--text|--json] <command> [args]\n"
       << "\n"
       << "Commands:\n"
       << "  status\n"
       << "  diff <file> [--staged]\n"
       << "  stage-hunk <file> <hunk>\n"
       << "  unstage-hunk <file> <hunk>\n"
       << "  discard-hunk <file> <hunk>\n"
       << "  stage-lines <file> <hunk> <lines>      lines as 0,2,5-7 or [0,2,5]\n"
       << "  unstage-lines <file> <hunk> <lines>\n"
       << "  discard-lines <file> <hunk> <lines>\n"
       << "  stage-file <file>\n"
       << "  unstage-file <file>\n"
       << "  discard-file <file>\n"
       << "  stage-all\n"
       << "  unstage-all\n"
       << "\n"
       << "Hunk and line indices come from the latest `diff` output and are stale\n"
       << "after any stage, unstage or discard.\n";
}

static int print_result(const StagingResult& result, bool text_output) {
  if (text_output) {
    (result.success ? cout : cerr) << result.message << endl;
  } else {
    cout << to_json(result).dump(2) << endl;
  }
  return result.success ? 0 : 1;
}

int main(int argc, char *argv[]) {
  string start_dir = ".";
  int verbose = -1;
  int text_output = -1;
  vector<string> args;

  for (int i = 1; i < argc; i++) {
    string arg = argv[i];
    if (!args.empty()) {
      args.push_back(arg);
    } else if (arg == "-vv") {
      verbose = 2;
    } else if (arg == "-v") {
      verbose = 1;
    } else if (arg == "--text") {
      text_output = 1;
    } else if (arg == "--json") {
      text_output = 0;
    } else if (arg == "-C") {
      if (i + 1 < argc) {
        start_dir = argv[++i];
      } else {
        cerr << "Error: -C requires a directory" << endl;
        return 2;
      }
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      cerr << "Error: unknown option " << arg << endl;
      print_usage(argv[0]);
      return 2;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  StageConfig config = load_config(start_dir);
  if (verbose >= 0) config.verbose = verbose;
  if (text_output >= 0) config.text_output = text_output == 1;

  try {
    config.repo_root = resolve_repo_root(config.git_binary, start_dir);
  } catch (const exception& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }
  if (config.verbose >= 1) cerr << "Repository root: " << config.repo_root << endl;

  const string& command = args[0];
  FileStaging files(config.repo_root, config.git_binary, config.verbose);

  if (command == "status" && args.size() == 1) {
    try {
      WorkingStatus status = files.get_working_status();
      if (config.text_output) {
        cout << format_working_status(status);
      } else {
        cout << to_json(status).dump(2) << endl;
      }
      return 0;
    } catch (const exception& e) {
      cerr << "Error: " << e.what() << endl;
      return 1;
    }
  }
  if (command == "stage-all" && args.size() == 1) {
    return print_result(files.stage_all(), config.text_output);
  }
  if (command == "unstage-all" && args.size() == 1) {
    return print_result(files.unstage_all(), config.text_output);
  }
  if (args.size() < 2) {
    print_usage(argv[0]);
    return 2;
  }

  const string& filepath = args[1];
  if (command == "stage-file" && args.size() == 2) {
    return print_result(files.stage_file(filepath), config.text_output);
  }
  if (command == "unstage-file" && args.size() == 2) {
    return print_result(files.unstage_file(filepath), config.text_output);
  }
  if (command == "discard-file" && args.size() == 2) {
    return print_result(files.discard_file_changes(filepath), config.text_output);
  }

  GitDiffSource source(config.repo_root, config.git_binary, config.verbose);
  GitPatchApplier applier(config.repo_root, config.git_binary, config.verbose);
  StagingService staging(source, applier, config.verbose);

  if (command == "diff" && (args.size() == 2 || (args.size() == 3 && args[2] == "--staged"))) {
    bool staged = args.size() == 3;
    optional<FileDiff> diff = staging.get_file_diff(filepath, staged);
    if (config.text_output) {
      if (diff) cout << format_file_diff(*diff);
      else cout << "No " << (staged ? "staged" : "unstaged") << " changes in " << filepath << endl;
    } else {
      cout << (diff ? to_json(*diff) : json(nullptr)).dump(2) << endl;
    }
    return 0;
  }

  int hunk_index = 0;
  vector<int> lines;
  try {
    if (args.size() < 3) throw invalid_argument("missing hunk index");
    hunk_index = parse_index(args[2]);
    if (args.size() == 4) lines = parse_line_selection(args[3]);
  } catch (const invalid_argument& e) {
    cerr << "Error: " << e.what() << endl;
    print_usage(argv[0]);
    return 2;
  } catch (const exception& e) {
    cerr << "Error: cannot read line selection: " << e.what() << endl;
    return 2;
  }

  if (args.size() == 3) {
    if (command == "stage-hunk")   return print_result(staging.stage_hunk(filepath, hunk_index), config.text_output);
    if (command == "unstage-hunk") return print_result(staging.unstage_hunk(filepath, hunk_index), config.text_output);
    if (command == "discard-hunk") return print_result(staging.discard_hunk(filepath, hunk_index), config.text_output);
  } else if (args.size() == 4) {
    if (command == "stage-lines")   return print_result(staging.stage_lines(filepath, hunk_index, lines), config.text_output);
    if (command == "unstage-lines") return print_result(staging.unstage_lines(filepath, hunk_index, lines), config.text_output);
    if (command == "discard-lines") return print_result(staging.discard_lines(filepath, hunk_index, lines), config.text_output);
  }

  cerr << "Error: unknown command or wrong arguments: " << command << endl;
  print_usage(argv[0]);
  return 2;
}
