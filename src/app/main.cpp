/**
 * @file main.cpp
 * @brief psgui headless monitor entry point
 *
 * Wires the library components together:
 * - GrpcConnector for the Pub/Sub service or an emulator
 * - SandboxProcessManager over docker for managed emulators
 * - AppCore, monitoring the requested subscriptions until interrupted
 */

#include <psgui/app/app_core.hpp>
#include <psgui/app/config.hpp>
#include <psgui/sandbox/docker_runtime.hpp>
#include <psgui/sandbox/sandbox_manager.hpp>
#include <psgui/services/grpc_connection.hpp>
#include <psgui/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace psgui;
using namespace psgui::app;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown.store(true);
}

namespace {

std::shared_ptr<core::EventSink> makeConsoleSink() {
    auto sink = std::make_shared<core::CallbackEventSink>();
    sink->on_message = [](const std::string& subscription, const core::BufferedMessage& msg) {
        std::cout << "[" << subscription << "] " << msg.id << ": " << msg.data;
        for (const auto& [key, value] : msg.attributes) {
            std::cout << " " << key << "=" << value;
        }
        if (msg.delivery_attempt) {
            std::cout << " (attempt " << *msg.delivery_attempt << ")";
        }
        std::cout << std::endl;
    };
    sink->on_stream_error = [](const std::string& subscription, const std::string& error) {
        LOG_ERROR("Monitor", "Stream error on {}: {}", subscription, error);
    };
    sink->on_sandbox_error = [](const std::string& profile, const std::string& error) {
        LOG_ERROR("Monitor", "Emulator error for profile {}: {}", profile, error);
    };
    return sink;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        if (!config.error.empty()) {
            std::cerr << "Error: " << config.error << "\n\n";
        }
        printUsage(argv[0]);
        return config.error.empty() ? 0 : 1;
    }

    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));
#ifndef _WIN32
    utils::Logger::instance().setColorEnabled(::isatty(STDERR_FILENO) != 0);
#endif

    core::ConnectionProfile profile = toProfile(config);
    core::Status valid = profile.validate();
    if (!valid.ok()) {
        std::cerr << "Error: " << valid.message() << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto sink = makeConsoleSink();

        auto sandbox = std::make_shared<sandbox::SandboxProcessManager>(
            std::make_shared<sandbox::DockerRuntime>(), sink);

        AppOptions options;
        options.buffer_size = config.buffer_size;
        options.auto_ack = config.auto_ack;
        options.stop_timeout = std::chrono::milliseconds(config.stop_timeout_ms);
        options.close_timeout = std::chrono::milliseconds(config.close_timeout_ms);
        options.sandbox_ready_timeout = std::chrono::milliseconds(config.sandbox_ready_timeout_ms);

        AppCore app(std::make_shared<services::GrpcConnector>(), sandbox, sink, options);

        LOG_INFO("Main", "Connecting with profile {} (project {}, emulator {})",
                 profile.id, profile.project_id,
                 core::emulatorModeName(profile.effectiveEmulatorMode()));

        core::Status status = app.connect(profile);
        if (!status.ok()) {
            LOG_FATAL("Main", "Connect failed: {}", status.toString());
            app.shutdown();
            return 1;
        }

        for (const auto& subscription : config.subscriptions) {
            status = app.startStream(subscription);
            if (!status.ok()) {
                LOG_ERROR("Main", "Cannot monitor {}: {}", subscription, status.toString());
            }
        }

        if (!config.publish_topic.empty()) {
            std::string message_id;
            status = app.publish(config.publish_topic, config.publish_data,
                                 config.publish_attributes, message_id);
            if (status.ok()) {
                LOG_INFO("Main", "Published message {} to {}", message_id, config.publish_topic);
            } else {
                LOG_ERROR("Main", "Publish failed: {}", status.message());
            }
        }

        if (config.subscriptions.empty()) {
            app.shutdown();
            return status.ok() ? 0 : 1;
        }

        LOG_INFO("Main", "Monitoring {} subscription(s), Ctrl+C to stop",
                 config.subscriptions.size());

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Main", "Shutting down...");
        app.shutdown();
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Main", "Fatal error: {}", e.what());
        return 1;
    }
}
