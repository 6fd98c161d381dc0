// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <exception>
#include <atomic>
#include <csignal>
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "trading_context.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include "ta_libc.h"

namespace {

    std::atomic<bool> stop_requested(false);

    void handleStopSignal(int /*signum*/) {
        stop_requested.store(true);
    }

    const char* kDefaultConfigPath = "config/trading_bot.json";

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;
    bool ta_lib_ready = false;

    try {
        // --- Configuration (before logging: it names the log sinks) ---
        std::string config_path = argc > 1 ? argv[1] : kDefaultConfigPath;
        core::BotConfig config = core::BotConfig::loadFromFile(config_path);

        // --- Initialize Logging ---
        core::logging::initialize(config.logging.base_filename,
                                  core::logging::level_from_string(config.logging.console_level),
                                  core::logging::level_from_string(config.logging.file_level),
                                  config.logging.directory);
        logger = core::logging::getLogger();
        logger->info("Kraken trading bot starting with config '{}'.", config_path);

        if (!config.hasCredentials()) {
            logger->warn("KRAKEN_API_KEY / KRAKEN_PRIVATE_KEY not set. Private calls (orders, balances) will fail.");
        }

        // --- TA-Lib ---
        TA_RetCode ta_status = TA_Initialize();
        if (ta_status != TA_SUCCESS) {
            throw core::TradingPlatformException("TA-Lib initialization failed with code " + std::to_string(ta_status));
        }
        ta_lib_ready = true;

        // --- Components ---
        bot::TradingContext context(std::move(config));
        context.bootstrap();

        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);
        logger->info("Running. Press Ctrl+C to stop.");

        context.getScheduler().run(stop_requested);

        logger->info("Kraken trading bot stopped.");

    // --- Exception Handling ---
    } catch (const core::TradingPlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        if (ta_lib_ready) TA_Shutdown();
        core::logging::shutdown();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        if (ta_lib_ready) TA_Shutdown();
        core::logging::shutdown();
        return 1;
    }

    TA_Shutdown();
    core::logging::shutdown();
    return 0;
}
