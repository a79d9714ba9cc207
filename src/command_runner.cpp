#include "command_runner.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <system_error>

CommandResult CommandRunner::run(const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "empty command line");
    }

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(),
                                "pipe failed for " + describe(argv));
    }

    // Build argv before fork; only async-signal-safe calls happen in the child
    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);

        execvp(child_argv[0], child_argv.data());
        _exit(127); // execvp failed
    }

    if (pid < 0) {
        int fork_errno = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::system_error(fork_errno, std::generic_category(),
                                "fork failed for " + describe(argv));
    }

    // Parent process
    close(pipefd[1]);

    CommandResult result;
    char buffer[4096];
    for (;;) {
        ssize_t bytes_read = read(pipefd[0], buffer, sizeof(buffer));
        if (bytes_read > 0) {
            if (result.output.size() < kMaxCapturedOutput) {
                result.output.append(buffer, static_cast<size_t>(bytes_read));
            }
        } else if (bytes_read == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(pipefd[0]);

    int status = 0;
    if (!safe_waitpid(pid, &status)) {
        throw std::system_error(errno, std::generic_category(),
                                "waitpid failed for " + describe(argv));
    }

    if (WIFEXITED(status)) {
        result.exited_normally = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exited_normally = false;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::string CommandRunner::describe(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

bool CommandRunner::safe_waitpid(pid_t pid, int* status) {
    for (;;) {
        pid_t result = waitpid(pid, status, 0);
        if (result == pid) {
            return true;
        }
        if (result == -1 && errno == EINTR) {
            continue;
        }
        return false;
    }
}
