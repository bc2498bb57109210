/**
 * @file docker_runtime.cpp
 * @brief docker CLI process control through fork/exec.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/sandbox/docker_runtime.hpp"
#include "psgui/net/tcp_socket.hpp"
#include "psgui/utils/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace psgui {
namespace sandbox {

namespace {

constexpr std::chrono::milliseconds INSPECT_TIMEOUT{5000};
constexpr std::chrono::milliseconds STOP_TIMEOUT{10000};

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool isNoSuchObject(const CommandResult& result) {
    return result.err.find("No such") != std::string::npos;
}

/**
 * @brief Pipe with both ends closed on destruction unless released.
 */
struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }

    int releaseRead() { int fd = fds[0]; fds[0] = -1; return fd; }

    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }

    ~Pipe() { closeRead(); closeWrite(); }
};

/**
 * @brief Child-side plumbing for spawn().
 */
struct Spawned {
    pid_t pid = -1;
    int out_fd = -1;
    int err_fd = -1;
    int exec_errno = 0;
};

/**
 * @brief fork/exec @p program with stdout and stderr redirected to pipes.
 *
 * Exec failures are reported through a close-on-exec status pipe so the
 * parent can tell "could not start" apart from "exited with 127".
 */
Spawned spawn(const std::string& program, const std::vector<std::string>& args) {
    Spawned result;
    Pipe out, err, status;
    if (!out.open() || !err.open() || !status.open()) {
        result.exec_errno = errno;
        return result;
    }

    std::vector<std::string> argvStorage;
    argvStorage.reserve(args.size() + 1);
    argvStorage.push_back(program);
    argvStorage.insert(argvStorage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argvStorage.size() + 1);
    for (auto& arg : argvStorage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.exec_errno = errno;
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        ::setpgid(0, 0);

        ::execvp(program.c_str(), argv.data());

        int code = errno;
        ssize_t ignored = ::write(status.fds[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    // Parent process
    out.closeWrite();
    err.closeWrite();
    status.closeWrite();

    int code = 0;
    ssize_t n;
    do {
        n = ::read(status.fds[0], &code, sizeof(code));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(code))) {
        int ignored;
        ::waitpid(pid, &ignored, 0);
        result.exec_errno = code;
        return result;
    }

    result.pid = pid;
    result.out_fd = out.releaseRead();
    result.err_fd = err.releaseRead();
    return result;
}

std::string describeExit(int status) {
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return std::string("signal: ") + ::strsignal(WTERMSIG(status));
    }
    return "unknown exit";
}

/**
 * @class DockerProcess
 * @brief Foreground `docker run` child with its output pumped into the logger.
 */
class DockerProcess : public RunningProcess {
public:
    DockerProcess(std::string name, const Spawned& spawned)
        : name_(std::move(name)), pid_(spawned.pid) {
        outPump_ = std::thread(&DockerProcess::pump, name_, spawned.out_fd, "stdout");
        errPump_ = std::thread(&DockerProcess::pump, name_, spawned.err_fd, "stderr");
    }

    ~DockerProcess() override {
        bool reaped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reaped = reaped_;
            if (!reaped_) {
                ::kill(pid_, SIGKILL);
            }
        }
        if (!reaped) {
            int status;
            ::waitpid(pid_, &status, 0);
        }
        joinPumps();
    }

    core::Status wait() override {
        // Wait without reaping so terminate() never signals a recycled pid
        siginfo_t info{};
        int rc;
        do {
            rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
        } while (rc < 0 && errno == EINTR);

        int status = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!reaped_) {
                ::waitpid(pid_, &status, 0);
                reaped_ = true;
                exitStatus_ = status;
            } else {
                status = exitStatus_;
            }
        }
        joinPumps();

        if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
            return core::Status::OK();
        }
        return core::Status(core::ErrorCode::PROCESS_EXITED, describeExit(status));
    }

    void terminate() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reaped_) {
            // docker run proxies the signal to the container
            ::kill(pid_, SIGTERM);
        }
    }

    void kill() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reaped_) {
            ::kill(pid_, SIGKILL);
        }
    }

private:
    static void pump(std::string name, int fd, const char* stream) {
        std::string pending;
        char chunk[4096];
        for (;;) {
            ssize_t n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            pending.append(chunk, static_cast<size_t>(n));
            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos) {
                std::string line = trim(pending.substr(0, pos));
                pending.erase(0, pos + 1);
                if (!line.empty()) {
                    LOG_INFO("Emulator", "[{}] [{}] {}", name, stream, line);
                }
            }
        }
        std::string rest = trim(pending);
        if (!rest.empty()) {
            LOG_INFO("Emulator", "[{}] [{}] {}", name, stream, rest);
        }
        ::close(fd);
    }

    void joinPumps() {
        std::lock_guard<std::mutex> lock(pumpMutex_);
        if (outPump_.joinable()) outPump_.join();
        if (errPump_.joinable()) errPump_.join();
    }

    std::string name_;
    pid_t pid_;
    std::mutex mutex_;
    bool reaped_ = false;
    int exitStatus_ = 0;
    std::mutex pumpMutex_;
    std::thread outPump_;
    std::thread errPump_;
};

}  // namespace

// =============================================================================
// Free helpers
// =============================================================================

CommandResult runCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout) {
    CommandResult result;
    Spawned child = spawn(program, args);
    if (child.pid < 0) {
        result.err = std::strerror(child.exec_errno);
        return result;
    }
    result.started = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    struct pollfd fds[2] = {{child.out_fd, POLLIN, 0}, {child.err_fd, POLLIN, 0}};
    int open = 2;
    char chunk[4096];

    while (open > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        int rc = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            result.timed_out = true;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(chunk, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open;
            }
        }
    }

    for (auto& pfd : fds) {
        if (pfd.fd >= 0) {
            ::close(pfd.fd);
        }
    }

    if (result.timed_out) {
        ::kill(-child.pid, SIGKILL);
        ::kill(child.pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(child.pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

bool findOnPath(const std::string& program, std::string& resolved) {
    if (program.find('/') != std::string::npos) {
        if (::access(program.c_str(), X_OK) == 0) {
            resolved = program;
            return true;
        }
        return false;
    }

    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }

    std::string dirs(path);
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            resolved = candidate;
            return true;
        }
        start = end + 1;
    }
    return false;
}

// =============================================================================
// DockerRuntime
// =============================================================================

DockerRuntime::DockerRuntime(std::string docker_binary)
    : binary_(std::move(docker_binary)) {}

CommandResult DockerRuntime::docker(const std::vector<std::string>& args,
                                    std::chrono::milliseconds timeout) const {
    return runCommand(binary_, args, timeout);
}

core::Status DockerRuntime::checkAvailable() {
    std::string resolved;
    if (!findOnPath(binary_, resolved)) {
        return core::Status(core::ErrorCode::RUNTIME_UNAVAILABLE,
                            "docker CLI not found: please install Docker Desktop or Docker Engine");
    }

    CommandResult info = docker({"info"}, INSPECT_TIMEOUT);
    if (info.timed_out) {
        return core::Status(core::ErrorCode::RUNTIME_UNAVAILABLE,
                            "docker daemon not responding (timeout)");
    }
    if (!info.started || info.exit_code != 0) {
        return core::Status(core::ErrorCode::RUNTIME_UNAVAILABLE,
                            "docker daemon not running: " + trim(info.out + info.err));
    }
    LOG_DEBUG("Docker", "Runtime available at {}", resolved);
    return core::Status::OK();
}

core::Status DockerRuntime::isInstanceRunning(const std::string& name, bool& running) {
    running = false;
    CommandResult result = docker({"inspect", "-f", "{{.State.Running}}", name}, INSPECT_TIMEOUT);
    if (result.timed_out) {
        return core::Status(core::ErrorCode::INTERNAL, "docker inspect timed out for " + name);
    }
    if (!result.started) {
        return core::Status(core::ErrorCode::RUNTIME_UNAVAILABLE, "cannot run docker: " + result.err);
    }
    if (result.exit_code != 0) {
        if (isNoSuchObject(result)) {
            return core::Status::OK();
        }
        return core::Status(core::ErrorCode::INTERNAL,
                            "docker inspect failed for " + name + ": " + trim(result.err));
    }
    running = trim(result.out) == "true";
    return core::Status::OK();
}

core::Status DockerRuntime::instanceMatches(const std::string& name,
                                            const SandboxSettings& settings,
                                            bool& matches) {
    matches = false;

    CommandResult image = docker({"inspect", "-f", "{{.Config.Image}}", name}, INSPECT_TIMEOUT);
    if (image.timed_out || image.exit_code != 0) {
        return core::Status(core::ErrorCode::INTERNAL,
                            "failed to inspect container image: " + trim(image.err));
    }
    std::string actualImage = trim(image.out);
    std::string wantedImage = expectedImage(settings);
    if (actualImage != wantedImage) {
        LOG_INFO("Docker", "Container image mismatch for {}: expected {}, actual {}",
                 name, wantedImage, actualImage);
        return core::Status::OK();
    }

    CommandResult ports = docker(
        {"inspect", "-f",
         "{{range $k, $v := .NetworkSettings.Ports}}{{$k}}={{range $v}}{{.HostIp}}:{{.HostPort}}{{end}} {{end}}",
         name},
        INSPECT_TIMEOUT);
    if (ports.timed_out || ports.exit_code != 0) {
        return core::Status(core::ErrorCode::INTERNAL,
                            "failed to inspect container ports: " + trim(ports.err));
    }

    std::string mapping = trim(ports.out);
    std::string actualBind;
    if (!parsePortMapping(mapping, settings.port, actualBind)) {
        LOG_INFO("Docker", "Container port mapping not found for {}: expected host port {}, actual '{}'",
                 name, settings.port, mapping);
        return core::Status::OK();
    }

    std::string expectedBind = normalizeBindAddr(settings.bind_address, core::DEFAULT_SANDBOX_BIND);
    actualBind = normalizeBindAddr(actualBind, "0.0.0.0");
    if (actualBind != expectedBind) {
        LOG_INFO("Docker", "Container bind address mismatch for {}: expected {}, actual {}",
                 name, expectedBind, actualBind);
        return core::Status::OK();
    }

    matches = true;
    return core::Status::OK();
}

core::Status DockerRuntime::launch(const std::string& name,
                                   const SandboxSettings& settings,
                                   std::unique_ptr<RunningProcess>& out) {
    Spawned child = spawn(binary_, buildLaunchArgs(name, settings));
    if (child.pid < 0) {
        return core::Status(core::ErrorCode::INTERNAL,
                            std::string("failed to start container: ") + std::strerror(child.exec_errno));
    }
    out = std::make_unique<DockerProcess>(name, child);
    LOG_DEBUG("Docker", "Launched {} (pid {})", name, child.pid);
    return core::Status::OK();
}

core::Status DockerRuntime::stopInstance(const std::string& name) {
    CommandResult stop = docker({"stop", name}, STOP_TIMEOUT);
    if (stop.timed_out) {
        LOG_WARN("Docker", "docker stop timed out for {}, forcing removal", name);
    }

    CommandResult rm = docker({"rm", "-f", name}, STOP_TIMEOUT);
    if (rm.timed_out) {
        return core::Status(core::ErrorCode::INTERNAL, "docker rm timed out for " + name);
    }
    if (rm.exit_code != 0 && !isNoSuchObject(rm)) {
        return core::Status(core::ErrorCode::INTERNAL,
                            "failed to remove container " + name + ": " + trim(rm.err));
    }
    return core::Status::OK();
}

core::Status DockerRuntime::removeInstance(const std::string& name) {
    CommandResult rm = docker({"rm", "-f", name}, INSPECT_TIMEOUT);
    if (rm.timed_out) {
        return core::Status(core::ErrorCode::INTERNAL, "docker rm timed out for " + name);
    }
    if (rm.exit_code != 0 && !isNoSuchObject(rm)) {
        return core::Status(core::ErrorCode::INTERNAL,
                            "failed to remove container " + name + ": " + trim(rm.err));
    }
    return core::Status::OK();
}

bool DockerRuntime::isPortFree(const std::string& host, int port) {
    return net::isPortAvailable(host, static_cast<uint16_t>(port));
}

bool DockerRuntime::probe(const std::string& host, int port, std::chrono::milliseconds timeout) {
    return net::probeTcp(host, static_cast<uint16_t>(port), timeout);
}

}  // namespace sandbox
}  // namespace psgui
