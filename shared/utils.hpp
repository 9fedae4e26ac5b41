#ifndef UTILS_HPP
#define UTILS_HPP

#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "diffreader.hpp"
#include "file_staging.hpp"
#include "staging_result.hpp"
using namespace std;

nlohmann::json to_json(const DiffLine& line);
nlohmann::json to_json(const DiffHunk& hunk);
nlohmann::json to_json(const FileDiff& diff);
nlohmann::json to_json(const StagingResult& result);
nlohmann::json to_json(const WorkingStatus& status);

// "0,2,5-7" or a JSON array "[0,2,5]". Throws invalid_argument on anything else.
vector<int> parse_line_selection(const string& selection);
int parse_index(const string& value);

string format_file_diff(const FileDiff& diff);
string format_working_status(const WorkingStatus& status);

#endif // UTILS_HPP
