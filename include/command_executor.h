#ifndef COMMAND_EXECUTOR_H
#define COMMAND_EXECUTOR_H

#include <string>
#include <vector>

enum class ProcessStatus {
    Exited,         // code holds the exit status
    Signaled,       // code holds the terminating signal
    SpawnFailed     // code holds errno from fork or exec
};

struct ProcessResult {
    ProcessStatus status = ProcessStatus::SpawnFailed;
    int code = 0;

    bool succeeded() const { return status == ProcessStatus::Exited && code == 0; }
};

// Spawns a program with an argument vector and waits for it
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp/waitpid runner. The child inherits stdio.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv) override;
};

struct ExecResult {
    bool ok = false;
    int exit_code = -1;
    std::string error;
    std::vector<std::string> argv;
};

// Split on runs of whitespace. Quotes and escapes have no special meaning.
std::vector<std::string> split_command(const std::string& command_text);

// Describe a failed ProcessResult for the console
std::string describe_failure(const ProcessResult& result);

// Runs approved commands. Failures are reported, never thrown.
class CommandExecutor {
private:
    ProcessRunner& runner;
    bool debug_enabled = false;

public:
    CommandExecutor(ProcessRunner& process_runner, bool debug = false);

    ExecResult execute(const std::string& command_text);
};

#endif // COMMAND_EXECUTOR_H
