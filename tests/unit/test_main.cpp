// Hopstrip Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        // Initialize logging system for tests
        hopstrip::logging::init_logging_system();

        // Debug level so header logging paths are exercised
        hopstrip::control::LogConfig log_config;
        log_config.level = "debug";
        log_config.output = "/tmp/hopstrip_tests";
        hopstrip::logging::init_worker_logger(0, log_config);
    }

    ~GlobalSetup() {
        // Cleanup logging system
        hopstrip::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;
