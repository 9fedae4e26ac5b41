#ifndef STAGING_RESULT_HPP
#define STAGING_RESULT_HPP

#include <stdexcept>
#include <string>
using namespace std;

enum ErrorKind {
    ERROR_NONE,
    ERROR_VALIDATION,  // bad hunk/line selection, nothing was run
    ERROR_APPLY,       // git apply refused the patch
    ERROR_IO,          // reading a file from the working tree failed
    ERROR_GIT          // any other git or process failure
};

// Returned by every mutating operation. message can be shown to the user as-is.
struct StagingResult {
    bool success = false;
    string message;
    ErrorKind error = ERROR_NONE;

    static StagingResult ok(const string& message) {
        return StagingResult{true, message, ERROR_NONE};
    }
    static StagingResult fail(const string& message, ErrorKind error) {
        return StagingResult{false, message, error};
    }
};

class ValidationError : public runtime_error {
public:
    explicit ValidationError(const string& what) : runtime_error(what) {}
};

class IOFailure : public runtime_error {
public:
    explicit IOFailure(const string& what) : runtime_error(what) {}
};

class GitError : public runtime_error {
public:
    explicit GitError(const string& what) : runtime_error(what) {}
};

const char* errorKindName(ErrorKind error);

#endif // STAGING_RESULT_HPP
