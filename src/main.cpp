#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

#include "core/config/GuardConfig.hpp"
#include "core/logging/Logging.hpp"
#include "core/manager/PressureManager.hpp"

using namespace resguard::core;

// Флаг корректного завершения
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    config::GuardConfig config;
    if (argc > 1) {
        config = config::GuardConfig::loadFromFile(argv[1]);
    }

    if (!logging::initializeLogging(config.logging)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }
    spdlog::info("=== resguardd starting ===");
    if (argc > 1) {
        spdlog::info("Configuration loaded from {}", argv[1]);
    }
    spdlog::debug("Configuration: {}", config.toJson().dump());

    int exitCode = 0;
    try {
        manager::PressureManager manager(config);
        if (!manager.start()) {
            spdlog::error("Failed to start pressure manager");
            return 1;
        }
        spdlog::info("System: {}", manager.systemFacts().dump());

        const auto statusEvery = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(std::max(1.0, config.monitoring.intervalSeconds) * 12));
        auto lastStatus = std::chrono::steady_clock::now();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (now - lastStatus >= statusEvery) {
                lastStatus = now;
                auto status = manager.currentStatus();
                spdlog::info("Status: memory={} stress={} score={:.3f}",
                             status["memory"]["level"].get<std::string>(),
                             status["stress"]["state"].get<std::string>(),
                             status["stress"]["score"].get<double>());
            }
        }

        spdlog::info("Received shutdown signal, stopping...");
        spdlog::info("Final metrics: {}", manager.metrics().dump());
        manager.stop();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        exitCode = 1;
    }

    spdlog::info("=== resguardd stopped ===");
    spdlog::shutdown();
    return exitCode;
}
