#pragma once

#include "bt/DeviceRegistry.hpp"
#include "bt/HciAdapter.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
/**
 * A gattlib scan running on its own thread.
 * Every device reported by gattlib becomes a PRESENT event with the device address as path.
 **/
class BLEDiscoverySession : public DiscoverySession {
 public:
    using OnDeviceSeenFunc = std::function<void(const std::string& addr, const std::string& name)>;

 private:
    void* adapter;
    const size_t timeoutSeconds;
    OnDeviceSeenFunc onDeviceSeen;

    std::mutex m;
    std::condition_variable cv;
    std::deque<DiscoveryEvent> events{};
    bool closed{false};
    bool canceled{false};

    std::optional<std::thread> scanThread{std::nullopt};

 public:
    /**
     * Takes ownership of the given gattlib adapter and closes it once canceled.
     * A timeout of 0 scans until cancel() gets called.
     **/
    BLEDiscoverySession(void* adapter, size_t timeoutSeconds, OnDeviceSeenFunc onDeviceSeen);
    BLEDiscoverySession(BLEDiscoverySession&&) = delete;
    BLEDiscoverySession(const BLEDiscoverySession&) = delete;
    BLEDiscoverySession& operator=(BLEDiscoverySession&&) = delete;
    BLEDiscoverySession& operator=(const BLEDiscoverySession&) = delete;
    ~BLEDiscoverySession() override;

    void start();
    std::optional<DiscoveryEvent> next_event() override;
    void cancel() override;

 private:
    /**
     * Entry point of the scan thread.
     * gattlib_adapter_scan_enable() blocks until the timeout elapsed or the scan got disabled.
     **/
    void scan_run();
    void push_event(DiscoveryEvent&& event);
    static void on_device_discovered(void* adapter, const char* addr, const char* name, void* userData);
};

/**
 * DeviceRegistry backed by BlueZ.
 * Cached devices are the ones BlueZ stored below its storage directory (usually "/var/lib/bluetooth").
 * Discovery is performed via gattlib.
 **/
class BLERegistry : public DeviceRegistry {
 private:
    const std::string adapterName;
    const std::filesystem::path cacheDir;
    const size_t discoveryTimeoutSeconds;

    std::mutex adapterMutex;
    std::shared_ptr<HciAdapter> adapter{nullptr};

    // Address -> name of all devices this registry has seen so far:
    std::mutex knownDevicesMutex;
    std::map<std::string, std::string> knownDevices{};

 public:
    BLERegistry(std::string adapterName, std::filesystem::path cacheDir, size_t discoveryTimeoutSeconds);
    BLERegistry(BLERegistry&&) = delete;
    BLERegistry(const BLERegistry&) = delete;
    BLERegistry& operator=(BLERegistry&&) = delete;
    BLERegistry& operator=(const BLERegistry&) = delete;
    ~BLERegistry() override = default;

    std::shared_ptr<Adapter> get_default_adapter() override;
    bool list_cached_devices(std::vector<std::unique_ptr<Device>>* devices) override;
    std::unique_ptr<DiscoverySession> start_discovery() override;
    std::unique_ptr<Device> new_device(const std::string& path) override;

 private:
    std::shared_ptr<HciAdapter> get_hci_adapter();
    void remember_device(const std::string& addr, const std::string& name);
    /**
     * Reads all devices stored for the given adapter address into result.
     **/
    void load_stored_devices(const std::filesystem::path& adapterDir, std::map<std::string, std::string>* result) const;
    /**
     * Returns the "Name" key of the "[General]" group of the given BlueZ storage file.
     **/
    static std::optional<std::string> read_stored_name(const std::filesystem::path& path);
};
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
