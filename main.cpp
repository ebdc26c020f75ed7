#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/SecurityEvent.hpp"
#include "engine/CorrelationEngine.hpp"
#include "engine/RuleLoader.hpp"
#include "persistence/DatabaseManager.hpp"
#include "response/IncidentManager.hpp"

#include <nlohmann/json.hpp>
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace securewatch {

std::atomic<bool> g_running{true};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

// Writes each alert as one JSON line on stdout.
class StdoutAlertSink : public AlertSink {
public:
    void OnAlert(const Alert& alert) override {
        std::string line = alert.ToJson().dump();
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << line << '\n';
        std::cout.flush();
        if (!std::cout) {
            std::cout.clear();
            throw EmitError("stdout write failed");
        }
    }

    std::string GetName() const override { return "stdout"; }

private:
    std::mutex mutex_;
};

class SecureWatchCorrelator {
public:
    explicit SecureWatchCorrelator(AppConfig config) : config_(std::move(config)) {}

    bool Initialize() {
        LOG_INFO("Initializing SecureWatch correlator...");

        EventBus::Instance().InitAsyncPool(2);

        if (config_.persistence.enabled) {
            database_ = std::make_unique<DatabaseManager>();
            if (!database_->Initialize(config_.persistence.database_path)) {
                LOG_WARN("Failed to initialize DatabaseManager, continuing without persistence");
                database_.reset();
            }
        }

        engine_ = std::make_unique<CorrelationEngine>(config_.engine);

        incident_manager_ = std::make_shared<IncidentManager>();
        incident_manager_->Initialize(config_.incidents_dir, config_.incident_retention_ms);
        engine_->AddAlertSink(incident_manager_);
        engine_->AddAlertSink(std::make_shared<StdoutAlertSink>());

        bool rules_restored = false;
        if (database_) {
            engine_->AttachStore(database_.get());
            engine_->RestoreState();
            rules_restored = engine_->GetRegistry().GetRuleCount() > 0;
        }

        if (!rules_restored) {
            auto result = RuleLoader::LoadFile(config_.rules_path,
                                               config_.engine.scoring.default_base_confidence);
            size_t loaded = engine_->LoadRules(result.rules);
            LOG_INFO("Loaded {} rules from {} ({} rejected)", loaded, config_.rules_path, result.errors.size());
        }

        return true;
    }

    void Start() {
        engine_->Start();
        ingest_thread_ = std::thread(&SecureWatchCorrelator::IngestLoop, this);
        LOG_INFO("SecureWatch correlator started");
    }

    void Run() {
        LOG_INFO("SecureWatch correlator is now running. Reading events from stdin.");

        auto start_time = std::chrono::steady_clock::now();
        auto last_status = start_time;

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto current_time = std::chrono::steady_clock::now();
            if (current_time - last_status >= std::chrono::seconds(10)) {
                auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                    current_time - start_time).count();
                auto metrics = engine_->GetMetrics();
                LOG_INFO("Status: Uptime={}s, Events={}, Windows={}, Alerts={}, Suppressed={}, Open incidents={}",
                         elapsed,
                         metrics.Get(Counter::EVENTS_PROCESSED),
                         metrics.active_windows,
                         metrics.Get(Counter::ALERTS_EMITTED),
                         metrics.Get(Counter::ALERTS_SUPPRESSED),
                         incident_manager_->GetOpenIncidentCount());
                incident_manager_->PruneResolved(SystemClock().NowMs());
                last_status = current_time;
            }
        }
    }

    void Stop() {
        LOG_INFO("Stopping SecureWatch correlator...");

        g_running = false;
        if (ingest_thread_.joinable()) {
            ingest_thread_.join();
        }

        engine_->Stop();
        LOG_INFO("Final metrics: {}", engine_->GetMetrics().ToJson().dump());

        // Shutdown the async publish pool after the engine stops publishing
        EventBus::Instance().ShutdownAsyncPool();

        if (database_) {
            database_->Shutdown();
        }

        LOG_INFO("All components stopped");
    }

private:
    void IngestLoop() {
        std::string line;
        size_t line_no = 0;

        while (g_running) {
            if (std::cin.rdbuf()->in_avail() <= 0) {
                pollfd pfd{STDIN_FILENO, POLLIN, 0};
                int rc = poll(&pfd, 1, 200);
                if (rc == 0) {
                    continue;
                }
                if (rc < 0 && errno == EINTR) {
                    continue;
                }
            }

            if (!std::getline(std::cin, line)) {
                LOG_INFO("End of input after {} lines", line_no);
                break;
            }
            ++line_no;
            if (line.empty()) {
                continue;
            }

            try {
                auto event = SecurityEvent::FromJson(nlohmann::json::parse(line));
                if (!engine_->Submit(std::move(event))) {
                    LOG_WARN("Event on line {} rejected: engine not accepting", line_no);
                }
            } catch (const std::exception& ex) {
                LOG_WARN("Skipping malformed event on line {}: {}", line_no, ex.what());
            }
        }

        engine_->WaitIdle();
        g_running = false;
    }

    AppConfig config_;
    std::unique_ptr<DatabaseManager> database_;
    std::unique_ptr<CorrelationEngine> engine_;
    std::shared_ptr<IncidentManager> incident_manager_;
    std::thread ingest_thread_;
};

} // namespace securewatch

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config/engine.yaml";

    securewatch::AppConfig config;
    try {
        config = securewatch::LoadConfig(config_path);
    } catch (const securewatch::ConfigError& ex) {
        securewatch::Logger::Initialize("");
        LOG_CRITICAL("Invalid configuration {}: {}", config_path, ex.what());
        securewatch::Logger::Shutdown();
        return 2;
    }

    securewatch::Logger::Initialize(config.logging.file_path,
                                    config.logging.max_file_size,
                                    config.logging.max_files);
    securewatch::Logger::SetLevel(config.logging.level);

    LOG_INFO("==========================================================");
    LOG_INFO("  SecureWatch - Real-time Correlation & Rules Engine");
    LOG_INFO("==========================================================");

    std::signal(SIGINT, securewatch::SignalHandler);
    std::signal(SIGTERM, securewatch::SignalHandler);

    try {
        securewatch::SecureWatchCorrelator correlator(std::move(config));

        if (!correlator.Initialize()) {
            LOG_CRITICAL("Failed to initialize SecureWatch correlator");
            return 1;
        }

        correlator.Start();
        correlator.Run();
        correlator.Stop();

        LOG_INFO("SecureWatch shutdown complete");
        securewatch::Logger::Shutdown();

        return 0;
    } catch (const securewatch::ConfigError& ex) {
        // unreadable rules file
        LOG_CRITICAL("Invalid configuration: {}", ex.what());
        securewatch::Logger::Shutdown();
        return 2;
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
        securewatch::Logger::Shutdown();
        return 1;
    }
}
