#include "bt/BLERegistry.hpp"
#include "bt_acquire/ConfigLoader.hpp"
#include "bt_acquire/DeviceManager.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

namespace {
volatile std::sig_atomic_t interrupted = 0;

void on_signal(int /*signal*/) {
    interrupted = 1;
}
}  // namespace

int main(int argc, char** argv) {
    logger::setup_logger(spdlog::level::info);
    const std::string configPath = argc > 1 ? argv[1] : "acquire.xml";
    bt_acquire::AcquireConfig config;
    if (!bt_acquire::load_acquire_config(configPath, &config)) {
        return 1;
    }
    logger::setup_logger(config.logLevel);
    std::signal(SIGINT, &on_signal);
    std::signal(SIGTERM, &on_signal);

    SPDLOG_INFO("Starting acquire exec...");
    bt::BLERegistry registry(config.adapterName, config.cacheDir, config.discoveryTimeoutSeconds);
    bt_acquire::DeviceManager manager(&registry);
    bt_acquire::AcquireResult result = manager.init();
    if (result != bt_acquire::SUCCESS) {
        SPDLOG_ERROR("Initializing failed: {}", bt_acquire::to_string(result));
        return 1;
    }

    result = manager.search_and_connect(config.search);
    if (result != bt_acquire::SUCCESS) {
        SPDLOG_ERROR("Search and connect failed: {}", bt_acquire::to_string(result));
        return 1;
    }

    while (!manager.wait_for_connect(std::chrono::milliseconds{500})) {
        if (manager.get_state() == bt_acquire::IDLE) {
            SPDLOG_ERROR("Discovery ended without finding the requested device.");
            return 1;
        }
        if (interrupted) {
            SPDLOG_INFO("Interrupted. Stopping...");
            manager.stop();
            return 1;
        }
    }
    std::optional<bt_acquire::DeviceInfo> device = manager.get_connected_device();
    SPDLOG_INFO("Connected to '{}' ({}) after {} attempts.", device->name, device->address, manager.get_connect_attempt_count());

    while (!interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds{500});
    }
    SPDLOG_INFO("Interrupted. Disconnecting...");
    return 0;
}
