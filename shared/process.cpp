#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

static void ignore_sigpipe() {
    static once_flag once;
    // a child that exits before reading its stdin must not kill us
    call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

string describe_command(const vector<string>& argv) {
    string cmd;
    for (const string& arg : argv) {
        if (!cmd.empty()) {
            cmd += " ";
        }
        cmd += arg;
    }
    return cmd;
}

ProcessResult run_process(const vector<string>& argv, const string& cwd, const string& input) {
    if (argv.empty()) {
        throw runtime_error("run_process: empty command");
    }
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // close-on-exec so children started concurrently on other threads do not
    // hold our pipe ends open
    if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1) {
        string reason = strerror(errno);
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw runtime_error("Failed to create pipes: " + reason);
    }

    // nothing between fork and exec may allocate: another thread can hold the
    // allocator lock at the moment of the fork
    vector<char*> args;
    for (const string& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    const string chdir_failed = "cannot change to " + cwd + "\n";
    const string exec_failed = argv[0] + ": command not found or not executable\n";

    pid_t pid = fork();
    if (pid == -1) {
        string reason = strerror(errno);
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw runtime_error("Failed to fork: " + reason);
    }

    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        close_pipe(err_pipe);

        if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
            ssize_t ignored = write(STDERR_FILENO, chdir_failed.data(), chdir_failed.size());
            (void)ignored;
            _exit(127);
        }

        execvp(args[0], args.data());

        ssize_t ignored = write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
        (void)ignored;
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    fcntl(in_pipe[1], F_SETFL, O_NONBLOCK);
    if (input.empty()) {
        close_fd(in_pipe[1]);
    }

    ProcessResult result;
    size_t bytes_written = 0;
    char buffer[4096];

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        struct pollfd fds[3];
        int nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_pipe[1] >= 0) {
            fds[nfds] = {in_pipe[1], POLLOUT, 0};
            in_idx = nfds++;
        }
        if (out_pipe[0] >= 0) {
            fds[nfds] = {out_pipe[0], POLLIN, 0};
            out_idx = nfds++;
        }
        if (err_pipe[0] >= 0) {
            fds[nfds] = {err_pipe[0], POLLIN, 0};
            err_idx = nfds++;
        }

        if (poll(fds, nfds, -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        if (in_idx >= 0 && fds[in_idx].revents) {
            ssize_t n = write(in_pipe[1], input.data() + bytes_written, input.size() - bytes_written);
            if (n > 0) {
                bytes_written += static_cast<size_t>(n);
            }
            if ((n == -1 && errno != EAGAIN && errno != EINTR) || bytes_written == input.size()) {
                close_fd(in_pipe[1]);
            }
        }
        if (out_idx >= 0 && fds[out_idx].revents) {
            ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.out.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(out_pipe[0]);
            }
        }
        if (err_idx >= 0 && fds[err_idx].revents) {
            ssize_t n = read(err_pipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.err.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(err_pipe[0]);
            }
        }
    }
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw runtime_error("waitpid failed: " + string(strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
