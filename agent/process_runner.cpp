#include "process_runner.h"
#include "errors.h"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds kill_grace)
    : kill_grace_(kill_grace) {
}

pid_t PosixProcessRunner::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw ProcessError("Cannot spawn an empty command");
    }

    // exec failures are reported back through a close-on-exec pipe
    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        throw ProcessError(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(error_pipe[0]);
        close(error_pipe[1]);
        throw ProcessError(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        close(error_pipe[0]);
        setsid();

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) {
                close(devnull);
            }
        }

        execvp(args[0], args.data());

        int exec_errno = errno;
        ssize_t written = write(error_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }

    close(error_pipe[1]);

    int exec_errno = 0;
    ssize_t bytes = 0;
    do {
        bytes = read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (bytes < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (bytes > 0) {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to start " + argv[0] + ": " + std::strerror(exec_errno));
    }

    spdlog::debug("[ProcessRunner] Spawned {} (pid {})", argv[0], pid);
    return pid;
}

bool PosixProcessRunner::terminate(pid_t pid) {
    if (pid <= 0) {
        return false;
    }

    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            return false;
        }
        throw ProcessError("Failed to signal pid " + std::to_string(pid) + ": " + std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + kill_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::warn("[ProcessRunner] pid {} ignored SIGTERM, sending SIGKILL", pid);
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    return true;
}

bool PosixProcessRunner::isAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }

    // Reap our own children so they do not linger as zombies
    int status = 0;
    pid_t reaped = waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
        return false;
    }

    if (kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

CommandResult PosixProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw ProcessError("Cannot run an empty command");
    }

    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += shellQuote(arg);
    }

    std::array<char, 512> buffer;
    CommandResult result;

    FILE* pipe = popen((command + " 2>&1").c_str(), "r");
    if (!pipe) {
        throw ProcessError("popen() failed for command: " + command);
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        throw ProcessError("pclose() failed for command: " + command);
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    spdlog::debug("[ProcessRunner] '{}' exited with {}", command, result.exit_code);
    return result;
}

std::string PosixProcessRunner::shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
