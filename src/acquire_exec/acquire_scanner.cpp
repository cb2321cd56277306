#include "bt/BLERegistry.hpp"
#include "bt_acquire/ConfigLoader.hpp"
#include "logger/Logger.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    logger::setup_logger(spdlog::level::info);
    bt_acquire::AcquireConfig config;
    if (argc > 1 && !bt_acquire::load_acquire_config(argv[1], &config)) {
        return 1;
    }
    logger::setup_logger(config.logLevel);
    SPDLOG_INFO("Starting scanner...");

    bt::BLERegistry registry(config.adapterName, config.cacheDir, config.discoveryTimeoutSeconds);
    std::shared_ptr<bt::Adapter> adapter = registry.get_default_adapter();
    if (!adapter || !adapter->set_powered(true)) {
        SPDLOG_ERROR("No usable Bluetooth adapter.");
        return 1;
    }

    std::unordered_set<std::string> devices;
    std::vector<std::unique_ptr<bt::Device>> cached;
    if (registry.list_cached_devices(&cached)) {
        for (const std::unique_ptr<bt::Device>& device : cached) {
            devices.insert(device->get_address());
            SPDLOG_INFO("Cached device: {} ({})", device->get_name(), device->get_address());
        }
    }
    SPDLOG_INFO("Total cached: {}", devices.size());

    std::unique_ptr<bt::DiscoverySession> session = registry.start_discovery();
    if (!session) {
        SPDLOG_ERROR("Failed to start discovery.");
        return 1;
    }
    while (std::optional<bt::DiscoveryEvent> event = session->next_event()) {
        if (event->kind != bt::DiscoveryEventKind::PRESENT || devices.contains(event->path)) {
            continue;
        }
        devices.insert(event->path);
        std::unique_ptr<bt::Device> device = registry.new_device(event->path);
        SPDLOG_INFO("New device found: {} ({})", device ? device->get_name() : "", event->path);
        SPDLOG_INFO("Total: {}", devices.size());
    }
    session->cancel();
    SPDLOG_INFO("Discovery ended.");
    return 0;
}
