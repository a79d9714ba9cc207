#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <string>
#include <vector>
#include <sys/types.h>

struct CommandResult {
    bool exited_normally = false; // false when killed by a signal
    int exit_code = -1;
    std::string output;           // combined stdout/stderr

    bool succeeded() const { return exited_normally && exit_code == 0; }
};

/**
 * @brief Runs external binaries via fork/execvp, never through a shell
 *
 * Arguments are passed as an argv vector so addresses and chain names can
 * not be interpreted as shell syntax. stdout and stderr of the child are
 * captured through a pipe.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Throws std::system_error when the child can not be spawned or reaped.
    // A non-zero exit is reported in the result, not thrown.
    virtual CommandResult run(const std::vector<std::string>& argv) const;

    static std::string describe(const std::vector<std::string>& argv);

private:
    static constexpr size_t kMaxCapturedOutput = 1024 * 1024;

    static bool safe_waitpid(pid_t pid, int* status);
};

#endif // COMMAND_RUNNER_HPP
