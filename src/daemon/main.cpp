/**
 * @file main.cpp
 * @brief lanscoped daemon entry point
 *
 * This is the thin executable that wires together the library components:
 * - DiscoveryEngine owning the discovery pipeline and snapshot history
 * - InspectorService exposing it over gRPC
 * - An optional periodic scan scheduler
 */

#include <lanscope/daemon/config.hpp>
#include <lanscope/utils/logger.hpp>
#include <lanscope/core/discovery_engine.hpp>
#include <lanscope/services/inspector_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <chrono>

using namespace lanscope;
using namespace lanscope::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int signal) {
    (void)signal;
    g_shutdown.store(true);
}

/**
 * @brief Runs a scan every interval until stopped.
 *
 * Ticks that find a scan already running (e.g. one started over gRPC)
 * are skipped.
 */
class PeriodicScanner {
public:
    PeriodicScanner(core::DiscoveryEngine& engine, std::chrono::seconds interval)
        : engine_(engine)
        , interval_(interval)
    {
        thread_ = std::thread(&PeriodicScanner::loop, this);
    }

    ~PeriodicScanner() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
        engine_.cancelScan();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    PeriodicScanner(const PeriodicScanner&) = delete;
    PeriodicScanner& operator=(const PeriodicScanner&) = delete;

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopped_) {
            lock.unlock();
            auto result = engine_.runScan();
            if (result && result->report.cancelled) {
                LOG_INFO("Daemon", "Scheduled scan cancelled");
            } else if (result) {
                LOG_INFO("Daemon", "Scheduled scan stored snapshot {}", result->snapshot.id);
            } else {
                LOG_INFO("Daemon", "Scheduled scan skipped, another scan is running");
            }
            lock.lock();
            cv_.wait_for(lock, interval_, [this] { return stopped_; });
        }
    }

    core::DiscoveryEngine& engine_;
    std::chrono::seconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::thread thread_;
};

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error.empty() ? 0 : 1;
    }

    // Configure logging
    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "lanscoped starting...");
    LOG_INFO("Daemon", "Scan mode: {} ({}ms browse window)",
             config.scan_mode, browseWindow(config).count());
    LOG_INFO("Daemon", "Secondary tool: {}", config.tool);
    LOG_INFO("Daemon", "Data directory: {}", config.data_dir);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        core::DiscoveryEngine engine(toEngineConfig(config));

        auto inspector_service = std::make_unique<services::InspectorServiceImpl>(engine);

        // Build and start gRPC server
        std::string listen_addr = config.bind_addr + ":" + std::to_string(config.port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(listen_addr, grpc::InsecureServerCredentials());
        builder.RegisterService(inspector_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start gRPC server on {}", listen_addr);
            return 1;
        }
        LOG_INFO("Daemon", "Inspector service listening on {}", listen_addr);

        std::unique_ptr<PeriodicScanner> scanner;
        if (config.scan_interval_s > 0) {
            scanner = std::make_unique<PeriodicScanner>(
                engine, std::chrono::seconds(config.scan_interval_s));
            LOG_INFO("Daemon", "Scanning every {}s", config.scan_interval_s);
        }

        LOG_INFO("Daemon", "lanscoped is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        scanner.reset();
        engine.cancelScan();

        // Stop gRPC server
        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        LOG_INFO("Daemon", "lanscoped stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
