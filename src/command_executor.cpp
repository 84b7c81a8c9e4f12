#include "command_executor.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

} // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv) {
    ProcessResult result;
    if (argv.empty()) {
        result.code = EINVAL;
        return result;
    }

    // The child writes its exec errno here; a clean exec closes the pipe
    int report[2] = {-1, -1};
    if (pipe2(report, O_CLOEXEC) != 0) {
        result.code = errno;
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.code = errno;
        close_pipe(report);
        return result;
    }

    if (pid == 0) {
        close(report[0]);
        execvp(cargv[0], cargv.data());
        int exec_errno = errno;
        ssize_t written = write(report[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }

    close(report[1]);
    report[1] = -1;

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(report[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close(report[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.status = ProcessStatus::SpawnFailed;
        result.code = exec_errno;
        return result;
    }
    if (waited < 0) {
        result.status = ProcessStatus::SpawnFailed;
        result.code = errno;
        return result;
    }

    if (WIFEXITED(status)) {
        result.status = ProcessStatus::Exited;
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.status = ProcessStatus::Signaled;
        result.code = WTERMSIG(status);
    }
    return result;
}

std::vector<std::string> split_command(const std::string& command_text) {
    std::vector<std::string> parts;
    std::istringstream stream(command_text);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string describe_failure(const ProcessResult& result) {
    std::stringstream ss;
    switch (result.status) {
        case ProcessStatus::Exited:
            ss << "exited with status " << result.code;
            break;
        case ProcessStatus::Signaled:
            ss << "terminated by signal " << result.code << " (" << strsignal(result.code) << ")";
            break;
        case ProcessStatus::SpawnFailed:
            ss << "could not start: " << std::strerror(result.code);
            break;
    }
    return ss.str();
}

CommandExecutor::CommandExecutor(ProcessRunner& process_runner, bool debug)
    : runner(process_runner), debug_enabled(debug) {}

ExecResult CommandExecutor::execute(const std::string& command_text) {
    ExecResult exec;
    exec.argv = split_command(command_text);

    if (exec.argv.empty()) {
        exec.error = "empty command";
        std::cerr << "Command execution failed: " << exec.error << std::endl;
        return exec;
    }

    if (debug_enabled) {
        std::cout << "Debug: Executing " << exec.argv[0] << " with " << exec.argv.size() - 1
                  << " argument(s)" << std::endl;
    }

    ProcessResult result = runner.run(exec.argv);
    if (result.status == ProcessStatus::Exited) {
        exec.exit_code = result.code;
    }

    if (!result.succeeded()) {
        exec.error = exec.argv[0] + " " + describe_failure(result);
        std::cerr << "Command execution failed: " << exec.error << std::endl;
        return exec;
    }

    exec.ok = true;
    std::cout << "Command executed successfully." << std::endl;
    return exec;
}
