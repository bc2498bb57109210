/**
 * @file docker_runtime.hpp
 * @brief SandboxRuntime backed by the docker CLI.
 *
 * Commands are run through fork/exec with bounded waits. The emulator
 * container itself runs in the foreground of a `docker run` child whose
 * stdout and stderr are forwarded line by line to the logger under the
 * "Emulator" component.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/sandbox/export.hpp"
#include "psgui/sandbox/sandbox_runtime.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace psgui {
namespace sandbox {

/**
 * @brief Outcome of a short-lived command.
 */
struct CommandResult {
    bool started = false;      ///< exec succeeded
    bool timed_out = false;
    int exit_code = -1;
    std::string out;
    std::string err;
};

/**
 * @brief Run @p program with @p args, capturing output, killing it after @p timeout.
 */
PSGUI_SANDBOX_API CommandResult runCommand(const std::string& program,
                                           const std::vector<std::string>& args,
                                           std::chrono::milliseconds timeout);

/**
 * @brief Locate @p program on PATH.
 */
PSGUI_SANDBOX_API bool findOnPath(const std::string& program, std::string& resolved);

class PSGUI_SANDBOX_API DockerRuntime : public SandboxRuntime {
public:
    explicit DockerRuntime(std::string docker_binary = "docker");

    core::Status checkAvailable() override;
    core::Status isInstanceRunning(const std::string& name, bool& running) override;
    core::Status instanceMatches(const std::string& name,
                                 const SandboxSettings& settings,
                                 bool& matches) override;
    core::Status launch(const std::string& name,
                        const SandboxSettings& settings,
                        std::unique_ptr<RunningProcess>& out) override;
    core::Status stopInstance(const std::string& name) override;
    core::Status removeInstance(const std::string& name) override;
    bool isPortFree(const std::string& host, int port) override;
    bool probe(const std::string& host, int port, std::chrono::milliseconds timeout) override;

private:
    CommandResult docker(const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout) const;

    std::string binary_;
};

}  // namespace sandbox
}  // namespace psgui
