#include <gattlib.h>  // Include first since we have some structs forward declared

#include "bt/BLEDevice.hpp"
#include "bt/BLERegistry.hpp"
#include "bt/BTAddress.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
BLEDiscoverySession::BLEDiscoverySession(void* adapter, size_t timeoutSeconds, OnDeviceSeenFunc onDeviceSeen) : adapter(adapter),
                                                                                                                 timeoutSeconds(timeoutSeconds),
                                                                                                                 onDeviceSeen(std::move(onDeviceSeen)) {}

BLEDiscoverySession::~BLEDiscoverySession() {
    cancel();
}

void BLEDiscoverySession::start() {
    assert(!scanThread);
    scanThread = std::make_optional<std::thread>(&BLEDiscoverySession::scan_run, this);
}

void BLEDiscoverySession::scan_run() {
    SPDLOG_DEBUG("Scanning for devices...");
    int result = gattlib_adapter_scan_enable(adapter, &BLEDiscoverySession::on_device_discovered, timeoutSeconds, this);
    if (result != GATTLIB_SUCCESS) {
        SPDLOG_ERROR("Bluetooth scan failed with error code {}.", result);
    } else {
        SPDLOG_INFO("Scan stopped.");
    }
    std::unique_lock<std::mutex> lk(m);
    closed = true;
    lk.unlock();
    cv.notify_all();
}

void BLEDiscoverySession::on_device_discovered(void* /*adapter*/, const char* addr, const char* name, void* userData) {
    BLEDiscoverySession* session = static_cast<BLEDiscoverySession*>(userData);
    if (!addr) {
        return;
    }
    std::string nameStr = name ? name : "";
    SPDLOG_TRACE("FOUND: {} ({})", nameStr, addr);
    if (session->onDeviceSeen) {
        session->onDeviceSeen(addr, nameStr);
    }
    session->push_event(DiscoveryEvent{DiscoveryEventKind::PRESENT, addr});
}

void BLEDiscoverySession::push_event(DiscoveryEvent&& event) {
    std::unique_lock<std::mutex> lk(m);
    if (closed) {
        return;
    }
    events.push_back(std::move(event));
    lk.unlock();
    cv.notify_one();
}

std::optional<DiscoveryEvent> BLEDiscoverySession::next_event() {
    std::unique_lock<std::mutex> lk(m);
    cv.wait(lk, [this] { return !events.empty() || closed; });
    if (events.empty()) {
        return std::nullopt;
    }
    DiscoveryEvent event = std::move(events.front());
    events.pop_front();
    return event;
}

void BLEDiscoverySession::cancel() {
    std::unique_lock<std::mutex> lk(m);
    if (canceled) {
        return;
    }
    canceled = true;
    lk.unlock();

    SPDLOG_DEBUG("Stopping scan...");
    if (scanThread) {
        int result = gattlib_adapter_scan_disable(adapter);
        if (result != GATTLIB_SUCCESS) {
            SPDLOG_WARN("Disabling the Bluetooth scan failed with error code {}.", result);
        }
        scanThread->join();
        scanThread.reset();
    }
    gattlib_adapter_close(adapter);
    adapter = nullptr;

    lk.lock();
    closed = true;
    events.clear();
    lk.unlock();
    cv.notify_all();
}

BLERegistry::BLERegistry(std::string adapterName, std::filesystem::path cacheDir, size_t discoveryTimeoutSeconds) : adapterName(std::move(adapterName)),
                                                                                                                     cacheDir(std::move(cacheDir)),
                                                                                                                     discoveryTimeoutSeconds(discoveryTimeoutSeconds) {}

std::shared_ptr<HciAdapter> BLERegistry::get_hci_adapter() {
    std::scoped_lock lk(adapterMutex);
    if (!adapter) {
        adapter = HciAdapter::open(adapterName);
    }
    return adapter;
}

std::shared_ptr<Adapter> BLERegistry::get_default_adapter() {
    return get_hci_adapter();
}

void BLERegistry::remember_device(const std::string& addr, const std::string& name) {
    std::scoped_lock lk(knownDevicesMutex);
    std::string& knownName = knownDevices[addr];
    // Do not forget a name in case the device later on gets reported without one:
    if (!name.empty() || knownName.empty()) {
        knownName = name;
    }
}

std::optional<std::string> BLERegistry::read_stored_name(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    bool inGeneral = false;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line[0] == '[') {
            inGeneral = line.rfind("[General]", 0) == 0;
            continue;
        }
        if (inGeneral && line.rfind("Name=", 0) == 0) {
            return line.substr(5);
        }
    }
    return std::nullopt;
}

void BLERegistry::load_stored_devices(const std::filesystem::path& adapterDir, std::map<std::string, std::string>* result) const {
    std::error_code ec;
    // Bonded devices: <adapter>/<device>/info
    std::filesystem::directory_iterator adapterIt(adapterDir, ec);
    if (ec) {
        SPDLOG_WARN("Failed to iterate over '{}' with: {}", adapterDir.string(), ec.message());
        return;
    }
    for (const std::filesystem::directory_entry& entry : adapterIt) {
        const std::string addr = entry.path().filename().string();
        if (!entry.is_directory(ec) || !is_normalized_address(addr)) {
            continue;
        }
        (*result)[addr] = read_stored_name(entry.path() / "info").value_or("");
    }

    // Devices BlueZ has seen before: <adapter>/cache/<device>
    const std::filesystem::path deviceCacheDir = adapterDir / "cache";
    if (!std::filesystem::is_directory(deviceCacheDir, ec)) {
        return;
    }
    std::filesystem::directory_iterator cacheIt(deviceCacheDir, ec);
    if (ec) {
        SPDLOG_WARN("Failed to iterate over '{}' with: {}", deviceCacheDir.string(), ec.message());
        return;
    }
    for (const std::filesystem::directory_entry& entry : cacheIt) {
        const std::string addr = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || !is_normalized_address(addr) || result->contains(addr)) {
            continue;
        }
        (*result)[addr] = read_stored_name(entry.path()).value_or("");
    }
}

bool BLERegistry::list_cached_devices(std::vector<std::unique_ptr<Device>>* devices) {
    std::shared_ptr<HciAdapter> hciAdapter = get_hci_adapter();
    if (!hciAdapter) {
        return false;
    }
    std::optional<std::string> adapterAddr = hciAdapter->get_address();
    if (!adapterAddr) {
        return false;
    }

    const std::filesystem::path adapterDir = cacheDir / *adapterAddr;
    std::map<std::string, std::string> stored;
    std::error_code ec;
    if (std::filesystem::is_directory(adapterDir, ec)) {
        load_stored_devices(adapterDir, &stored);
    } else {
        SPDLOG_DEBUG("No device cache found at '{}'.", adapterDir.string());
    }

    {
        // Devices from earlier discoveries:
        std::scoped_lock lk(knownDevicesMutex);
        for (const auto& [addr, name] : knownDevices) {
            stored.try_emplace(addr, name);
        }
    }

    for (auto& [addr, name] : stored) {
        remember_device(addr, name);
        devices->push_back(std::make_unique<BLEDevice>(std::string{name}, std::string{addr}));
    }
    SPDLOG_DEBUG("Found {} cached devices.", stored.size());
    return true;
}

std::unique_ptr<DiscoverySession> BLERegistry::start_discovery() {
    void* gattlibAdapter = nullptr;
    int result = gattlib_adapter_open(adapterName.empty() ? nullptr : adapterName.c_str(), &gattlibAdapter);
    if (result != GATTLIB_SUCCESS) {
        SPDLOG_ERROR("Failed to open Bluetooth adapter with error code {}.", result);
        return nullptr;
    }

    std::unique_ptr<BLEDiscoverySession> session = std::make_unique<BLEDiscoverySession>(
        gattlibAdapter,
        discoveryTimeoutSeconds,
        [this](const std::string& addr, const std::string& name) { this->remember_device(addr, name); });
    session->start();
    return session;
}

std::unique_ptr<Device> BLERegistry::new_device(const std::string& path) {
    std::string name;
    {
        std::scoped_lock lk(knownDevicesMutex);
        auto it = knownDevices.find(path);
        if (it == knownDevices.end()) {
            SPDLOG_WARN("Unknown device path '{}'.", path);
            return nullptr;
        }
        name = it->second;
    }
    return std::make_unique<BLEDevice>(std::move(name), std::string{path});
}
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
