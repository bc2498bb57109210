/**
 * @file sandbox_manager.cpp
 * @brief SandboxProcessManager implementation.
 *
 * All mutable state lives in Impl, which background threads keep alive
 * through shared_ptr. The lock only guards the instance map and records;
 * runtime calls, probes and joins always happen with the lock released.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#include "psgui/sandbox/sandbox_manager.hpp"
#include "psgui/core/cancellation.hpp"
#include "psgui/utils/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace psgui {
namespace sandbox {

using core::ErrorCode;
using core::Status;

const char* sandboxStatusName(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::Stopped:  return "stopped";
        case SandboxStatus::Starting: return "starting";
        case SandboxStatus::Running:  return "running";
        case SandboxStatus::Stopping: return "stopping";
        case SandboxStatus::Error:    return "error";
    }
    return "unknown";
}

namespace {

/**
 * @brief Bookkeeping for one tracked instance.
 */
struct Record {
    SandboxInstance info;
    ErrorCode error_code = ErrorCode::OK;
    bool auto_stop = true;

    core::CancellationToken token;           ///< Fired on stop or process exit
    std::atomic<bool> stop_requested{false};
    std::shared_ptr<RunningProcess> process;  ///< Null for adopted instances
    bool adopted = false;
    std::shared_ptr<core::CompletionSignal> exited = std::make_shared<core::CompletionSignal>();
    std::thread watcher;
    std::thread prober;
};

bool isActive(SandboxStatus status) {
    return status == SandboxStatus::Running || status == SandboxStatus::Starting;
}

}  // namespace

// =============================================================================
// Impl
// =============================================================================

class SandboxProcessManager::Impl : public std::enable_shared_from_this<Impl> {
public:
    Impl(std::shared_ptr<SandboxRuntime> runtime,
         std::shared_ptr<core::EventSink> sink,
         SandboxTiming timing)
        : runtime_(std::move(runtime))
        , sink_(std::move(sink))
        , timing_(timing) {}

    Status start(const std::string& profileId, const core::ManagedSandboxConfig& config);
    Status stop(const std::string& profileId);
    void release(const std::string& profileId);
    Status waitUntilReady(const std::string& profileId, std::chrono::milliseconds timeout);

    std::vector<std::string> trackedIds(bool filter, bool autoStop) const;
    SandboxInstance getStatus(const std::string& profileId) const;
    bool isRunning(const std::string& profileId) const;
    std::vector<SandboxInstance> list() const;

private:
    std::shared_ptr<Record> find(const std::string& profileId) const;
    void setError(const std::shared_ptr<Record>& record, ErrorCode code, const std::string& error);
    void markRunning(const std::shared_ptr<Record>& record, const char* how);
    void retire(const std::shared_ptr<Record>& record);
    /// True when an existing instance settled the start; @p outcome is the result
    bool tryAdopt(const std::shared_ptr<Record>& record, const SandboxSettings& settings,
                  Status& outcome);

    void watchProcess(std::shared_ptr<Record> record);
    void probeReadiness(std::shared_ptr<Record> record);

    std::shared_ptr<SandboxRuntime> runtime_;
    core::GuardedEventSink sink_;
    SandboxTiming timing_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<Record>> records_;
};

std::shared_ptr<Record> SandboxProcessManager::Impl::find(const std::string& profileId) const {
    auto it = records_.find(profileId);
    return it == records_.end() ? nullptr : it->second;
}

Status SandboxProcessManager::Impl::start(const std::string& profileId,
                                          const core::ManagedSandboxConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = find(profileId);
        if (existing && isActive(existing->info.status)) {
            return Status::OK();
        }
        if (existing && existing->info.status == SandboxStatus::Stopping) {
            return Status(ErrorCode::INTERNAL, "emulator for profile " + profileId + " is stopping");
        }
    }

    // Runtime precondition before any state is recorded
    Status available = runtime_->checkAvailable();
    if (!available.ok()) {
        LOG_ERROR("Sandbox", "Container runtime unavailable: {}", available.message());
        return available;
    }

    SandboxSettings settings = resolveSettings(config);
    auto record = std::make_shared<Record>();
    record->info.profile_id = profileId;
    record->info.name = instanceName(profileId);
    record->info.host = settings.bind_address;
    record->info.port = settings.port;
    record->info.status = SandboxStatus::Starting;
    record->auto_stop = config.auto_stop;

    std::shared_ptr<Record> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = find(profileId);
        if (existing && isActive(existing->info.status)) {
            return Status::OK();
        }
        if (existing && existing->info.status == SandboxStatus::Stopping) {
            return Status(ErrorCode::INTERNAL, "emulator for profile " + profileId + " is stopping");
        }
        previous = existing;
        records_[profileId] = record;
    }
    cv_.notify_all();

    if (previous) {
        // Leftover Error/Stopped record; make sure its threads are gone
        retire(previous);
    }

    LOG_INFO("Sandbox", "Starting emulator for profile {} ({} on {}:{}, image {})",
             profileId, record->info.name, settings.bind_address, settings.port, settings.image);

    Status adoptOutcome;
    if (tryAdopt(record, settings, adoptOutcome)) {
        return adoptOutcome;
    }

    Status removed = runtime_->removeInstance(record->info.name);
    if (!removed.ok()) {
        LOG_WARN("Sandbox", "Could not remove stale instance {}: {}",
                 record->info.name, removed.message());
    }

    if (!runtime_->isPortFree(settings.bind_address, settings.port)) {
        Status conflict(ErrorCode::PORT_CONFLICT,
                        "port " + std::to_string(settings.port) +
                        " is already in use on " + settings.bind_address);
        setError(record, conflict.code(), conflict.message());
        return conflict;
    }

    std::unique_ptr<RunningProcess> process;
    Status launched = runtime_->launch(record->info.name, settings, process);
    if (!launched.ok() || !process) {
        Status failure = launched.ok()
            ? Status(ErrorCode::INTERNAL, "failed to start container")
            : launched;
        setError(record, failure.code(), failure.message());
        return failure;
    }

    auto self = shared_from_this();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!record->stop_requested.load()) {
            record->process = std::move(process);
            record->watcher = std::thread(&Impl::watchProcess, self, record);
            record->prober = std::thread(&Impl::probeReadiness, self, record);
            return Status::OK();
        }
    }

    // Stopped while launching
    process->kill();
    Status exit = process->wait();
    LOG_INFO("Sandbox", "Emulator for profile {} stopped during launch ({})",
             profileId, exit.ok() ? "exited" : exit.message());
    return Status(ErrorCode::CANCELLED, "emulator start cancelled for profile " + profileId);
}

bool SandboxProcessManager::Impl::tryAdopt(const std::shared_ptr<Record>& record,
                                           const SandboxSettings& settings,
                                           Status& outcome) {
    const std::string& name = record->info.name;

    bool running = false;
    Status checked = runtime_->isInstanceRunning(name, running);
    if (!checked.ok()) {
        LOG_WARN("Sandbox", "Error checking existing instance {}: {}", name, checked.message());
        return false;
    }
    if (!running) {
        return false;
    }

    bool matches = false;
    Status compared = runtime_->instanceMatches(name, settings, matches);
    if (!compared.ok() || !matches) {
        if (!compared.ok()) {
            LOG_WARN("Sandbox", "Error validating instance {}, recreating: {}", name, compared.message());
        } else {
            LOG_INFO("Sandbox", "Instance {} config mismatch, recreating", name);
        }
        Status stopped = runtime_->stopInstance(name);
        if (!stopped.ok()) {
            LOG_WARN("Sandbox", "Could not stop mismatched instance {}: {}", name, stopped.message());
        }
        return false;
    }

    // A stop that already looked for the adopted flag cannot see this instance
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping = record->stop_requested.load();
        if (!stopping) {
            record->adopted = true;
        }
    }
    if (stopping) {
        Status stopped = runtime_->stopInstance(name);
        if (!stopped.ok()) {
            LOG_WARN("Sandbox", "Could not stop instance {} after cancelled start: {}",
                     name, stopped.message());
        }
        LOG_INFO("Sandbox", "Emulator for profile {} stopped during adoption", record->info.profile_id);
        outcome = Status(ErrorCode::CANCELLED,
                         "emulator start cancelled for profile " + record->info.profile_id);
        return true;
    }

    markRunning(record, "Reusing existing emulator instance");
    outcome = Status::OK();
    return true;
}

void SandboxProcessManager::Impl::markRunning(const std::shared_ptr<Record>& record, const char* how) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record->info.status != SandboxStatus::Starting) {
            return;
        }
        record->info.status = SandboxStatus::Running;
    }
    cv_.notify_all();
    LOG_INFO("Sandbox", "{} {} for profile {}", how, record->info.name, record->info.profile_id);
}

void SandboxProcessManager::Impl::setError(const std::shared_ptr<Record>& record,
                                           ErrorCode code, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->info.status = SandboxStatus::Error;
        record->info.error = error;
        record->error_code = code;
    }
    cv_.notify_all();
    LOG_ERROR("Sandbox", "Emulator error for profile {}: {}", record->info.profile_id, error);
    sink_.onSandboxError(record->info.profile_id, error);
}

void SandboxProcessManager::Impl::watchProcess(std::shared_ptr<Record> record) {
    Status exit = record->process->wait();
    record->exited->fire();
    record->token.cancel();

    bool expected = record->stop_requested.load();
    bool failed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (expected) {
            record->info.status = SandboxStatus::Stopped;
        } else if (!exit.ok()) {
            record->info.status = SandboxStatus::Error;
            record->info.error = exit.message();
            record->error_code = ErrorCode::PROCESS_EXITED;
            failed = true;
        } else {
            record->info.status = SandboxStatus::Stopped;
        }
    }
    cv_.notify_all();

    if (expected) {
        LOG_INFO("Sandbox", "Emulator stopped for profile {}", record->info.profile_id);
    } else if (failed) {
        LOG_ERROR("Sandbox", "Emulator process exited with error for profile {}: {}",
                  record->info.profile_id, exit.message());
        sink_.onSandboxError(record->info.profile_id, exit.message());
    } else {
        LOG_INFO("Sandbox", "Emulator exited for profile {}", record->info.profile_id);
    }
}

void SandboxProcessManager::Impl::probeReadiness(std::shared_ptr<Record> record) {
    // Dialled on loopback even when published on all interfaces
    const std::string host = core::DEFAULT_SANDBOX_BIND;
    const int port = record->info.port;

    for (int attempt = 0; attempt < timing_.probe_attempts; ++attempt) {
        if (record->token.isCancelled()) {
            return;
        }
        if (runtime_->probe(host, port, timing_.probe_timeout)) {
            markRunning(record, "Emulator is ready:");
            return;
        }
        if (record->token.waitFor(timing_.probe_interval)) {
            return;
        }
    }

    bool timedOut = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Only if nothing else moved the instance on in the meantime
        if (record->info.status == SandboxStatus::Starting) {
            record->info.status = SandboxStatus::Error;
            record->info.error = "timeout waiting for emulator to start";
            record->error_code = ErrorCode::READINESS_TIMEOUT;
            timedOut = true;
        }
    }
    if (timedOut) {
        cv_.notify_all();
        LOG_ERROR("Sandbox", "Timeout waiting for emulator for profile {}", record->info.profile_id);
        sink_.onSandboxError(record->info.profile_id, "timeout waiting for emulator to start");
    }
}

void SandboxProcessManager::Impl::retire(const std::shared_ptr<Record>& record) {
    record->stop_requested.store(true);
    record->token.cancel();

    std::shared_ptr<RunningProcess> process;
    bool adopted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = record->process;
        adopted = record->adopted;
    }

    if (process) {
        process->terminate();
        if (!record->exited->waitFor(timing_.grace_period)) {
            bool running = false;
            Status checked = runtime_->isInstanceRunning(record->info.name, running);
            if (!checked.ok() || running) {
                LOG_INFO("Sandbox", "Force stopping instance {}", record->info.name);
                Status stopped = runtime_->stopInstance(record->info.name);
                if (!stopped.ok()) {
                    LOG_WARN("Sandbox", "Force stop of {} failed: {}", record->info.name, stopped.message());
                }
            }
            if (!record->exited->waitFor(timing_.force_timeout)) {
                LOG_WARN("Sandbox", "Launcher for {} still alive, killing it", record->info.name);
                process->kill();
            }
        }
    } else if (adopted) {
        // Only the container itself can be stopped
        bool running = false;
        Status checked = runtime_->isInstanceRunning(record->info.name, running);
        if (checked.ok() && running) {
            LOG_INFO("Sandbox", "Force stopping instance {}", record->info.name);
            Status stopped = runtime_->stopInstance(record->info.name);
            if (!stopped.ok()) {
                LOG_WARN("Sandbox", "Force stop of {} failed: {}", record->info.name, stopped.message());
            }
        } else if (!checked.ok()) {
            LOG_WARN("Sandbox", "Error checking instance {}: {}", record->info.name, checked.message());
        }
    }

    std::thread watcher;
    std::thread prober;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        watcher = std::move(record->watcher);
        prober = std::move(record->prober);
    }
    if (prober.joinable()) prober.join();
    if (watcher.joinable()) watcher.join();
}

Status SandboxProcessManager::Impl::stop(const std::string& profileId) {
    std::shared_ptr<Record> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = find(profileId);
        if (!record || record->info.status == SandboxStatus::Stopping) {
            return Status::OK();
        }
        record->info.status = SandboxStatus::Stopping;
    }
    cv_.notify_all();

    LOG_INFO("Sandbox", "Stopping emulator for profile {}", profileId);
    retire(record);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->info.status = SandboxStatus::Stopped;
        record->info.error.clear();
        auto it = records_.find(profileId);
        if (it != records_.end() && it->second == record) {
            records_.erase(it);
        }
    }
    cv_.notify_all();
    return Status::OK();
}

void SandboxProcessManager::Impl::release(const std::string& profileId) {
    std::shared_ptr<Record> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = find(profileId);
        if (!record) {
            return;
        }
        records_.erase(profileId);
    }
    cv_.notify_all();

    // Leave the instance running; only the readiness probe is ours to end
    record->token.cancel();
    std::thread prober;
    std::thread watcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prober = std::move(record->prober);
        watcher = std::move(record->watcher);
    }
    if (prober.joinable()) prober.join();
    if (watcher.joinable()) watcher.detach();
    LOG_INFO("Sandbox", "Leaving emulator {} running for profile {}", record->info.name, profileId);
}

Status SandboxProcessManager::Impl::waitUntilReady(const std::string& profileId,
                                                   std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_for(lock, timeout, [&]() {
        auto record = find(profileId);
        return !record || record->info.status != SandboxStatus::Starting;
    });

    auto record = find(profileId);
    if (!record) {
        return Status(ErrorCode::NOT_FOUND, "emulator for profile " + profileId + " is not running");
    }
    if (!settled) {
        return Status(ErrorCode::READINESS_TIMEOUT, "timeout waiting for emulator to start");
    }
    switch (record->info.status) {
        case SandboxStatus::Running:
            return Status::OK();
        case SandboxStatus::Error:
            return Status(record->error_code == ErrorCode::OK ? ErrorCode::INTERNAL : record->error_code,
                          record->info.error);
        default:
            return Status(ErrorCode::PROCESS_EXITED,
                          "emulator for profile " + profileId + " is " +
                          sandboxStatusName(record->info.status));
    }
}

std::vector<std::string> SandboxProcessManager::Impl::trackedIds(bool filter, bool autoStop) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, record] : records_) {
        if (!filter || record->auto_stop == autoStop) {
            ids.push_back(id);
        }
    }
    return ids;
}

SandboxInstance SandboxProcessManager::Impl::getStatus(const std::string& profileId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = find(profileId);
    if (!record) {
        SandboxInstance stopped;
        stopped.profile_id = profileId;
        stopped.status = SandboxStatus::Stopped;
        return stopped;
    }
    return record->info;
}

bool SandboxProcessManager::Impl::isRunning(const std::string& profileId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = find(profileId);
    return record && record->info.status == SandboxStatus::Running;
}

std::vector<SandboxInstance> SandboxProcessManager::Impl::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxInstance> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(record->info);
    }
    return out;
}

// =============================================================================
// SandboxProcessManager
// =============================================================================

SandboxProcessManager::SandboxProcessManager(std::shared_ptr<SandboxRuntime> runtime,
                                             std::shared_ptr<core::EventSink> sink,
                                             SandboxTiming timing)
    : impl_(std::make_shared<Impl>(std::move(runtime), std::move(sink), timing)) {}

SandboxProcessManager::~SandboxProcessManager() {
    shutdown();
}

Status SandboxProcessManager::start(const std::string& profile_id,
                                    const core::ManagedSandboxConfig& config) {
    return impl_->start(profile_id, config);
}

Status SandboxProcessManager::stop(const std::string& profile_id) {
    return impl_->stop(profile_id);
}

void SandboxProcessManager::stopAll() {
    for (const auto& id : impl_->trackedIds(false, false)) {
        Status status = impl_->stop(id);
        if (!status.ok()) {
            LOG_WARN("Sandbox", "Failed to stop emulator for profile {}: {}", id, status.toString());
        }
    }
}

void SandboxProcessManager::shutdown() {
    for (const auto& id : impl_->trackedIds(true, true)) {
        Status status = impl_->stop(id);
        if (!status.ok()) {
            LOG_WARN("Sandbox", "Failed to stop emulator for profile {}: {}", id, status.toString());
        }
    }
    for (const auto& id : impl_->trackedIds(true, false)) {
        impl_->release(id);
    }
}

Status SandboxProcessManager::waitUntilReady(const std::string& profile_id,
                                             std::chrono::milliseconds timeout) {
    return impl_->waitUntilReady(profile_id, timeout);
}

SandboxInstance SandboxProcessManager::getStatus(const std::string& profile_id) const {
    return impl_->getStatus(profile_id);
}

bool SandboxProcessManager::isRunning(const std::string& profile_id) const {
    return impl_->isRunning(profile_id);
}

std::vector<SandboxInstance> SandboxProcessManager::list() const {
    return impl_->list();
}

}  // namespace sandbox
}  // namespace psgui
