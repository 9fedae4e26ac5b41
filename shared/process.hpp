#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>
using namespace std;

struct ProcessResult {
    int exit_code = -1;
    string out;
    string err;
};

// Runs argv[0] (looked up in PATH) inside cwd, feeding input on stdin.
// Blocks until the child exits. Throws runtime_error if the child could not
// be started; a program that cannot be executed exits with 127.
ProcessResult run_process(const vector<string>& argv, const string& cwd, const string& input = "");

string describe_command(const vector<string>& argv);

#endif // PROCESS_HPP
