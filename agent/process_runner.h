#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct CommandResult {
    int exit_code = -1;
    std::string output;

    bool ok() const { return exit_code == 0; }
};

// Boundary to the external processes the managers drive (tunnel clients,
// the reverse proxy). Swapped for a fake in tests.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Starts argv[0] detached from our stdio; throws ProcessError.
    virtual pid_t spawn(const std::vector<std::string>& argv) = 0;

    // Returns false if the process was already gone.
    virtual bool terminate(pid_t pid) = 0;

    virtual bool isAlive(pid_t pid) = 0;

    // Runs to completion and captures stdout+stderr; throws ProcessError
    // only when the command could not be started at all.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    explicit PosixProcessRunner(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(3000));

    pid_t spawn(const std::vector<std::string>& argv) override;
    bool terminate(pid_t pid) override;
    bool isAlive(pid_t pid) override;
    CommandResult run(const std::vector<std::string>& argv) override;

private:
    std::chrono::milliseconds kill_grace_;

    static std::string shellQuote(const std::string& arg);
};
