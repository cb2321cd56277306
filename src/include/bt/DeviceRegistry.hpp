#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
/**
 * A single remote device known to a DeviceRegistry.
 **/
class Device {
 public:
    Device() = default;
    Device(Device&&) = delete;
    Device(const Device&) = delete;
    Device& operator=(Device&&) = delete;
    Device& operator=(const Device&) = delete;
    virtual ~Device() = default;

    [[nodiscard]] virtual const std::string& get_address() const = 0;
    [[nodiscard]] virtual const std::string& get_name() const = 0;
    /**
     * Blocks until the connection got established or failed.
     * Returns true on success.
     **/
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;
};

enum DiscoveryEventKind {
    PRESENT,
    REMOVED
};

struct DiscoveryEvent {
    DiscoveryEventKind kind{DiscoveryEventKind::PRESENT};
    /**
     * Registry specific locator that can be passed to DeviceRegistry::new_device().
     **/
    std::string path{};
} __attribute__((aligned(64)));

/**
 * A running discovery.
 * The registry closes the event stream on its own once the discovery ends.
 **/
class DiscoverySession {
 public:
    DiscoverySession() = default;
    DiscoverySession(DiscoverySession&&) = delete;
    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(DiscoverySession&&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;
    virtual ~DiscoverySession() = default;

    /**
     * Blocks until the next event arrives.
     * Returns std::nullopt once the event stream got closed.
     **/
    virtual std::optional<DiscoveryEvent> next_event() = 0;
    /**
     * Stops the discovery and closes the event stream.
     * Calling it more than once has no effect.
     **/
    virtual void cancel() = 0;
};

class Adapter {
 public:
    Adapter() = default;
    Adapter(Adapter&&) = delete;
    Adapter(const Adapter&) = delete;
    Adapter& operator=(Adapter&&) = delete;
    Adapter& operator=(const Adapter&) = delete;
    virtual ~Adapter() = default;

    [[nodiscard]] virtual std::string get_name() const = 0;
    virtual bool set_powered(bool powered) = 0;
};

/**
 * Source of devices: the devices the host already knows about and the ones found by a live discovery.
 **/
class DeviceRegistry {
 public:
    DeviceRegistry() = default;
    DeviceRegistry(DeviceRegistry&&) = delete;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(DeviceRegistry&&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;
    virtual ~DeviceRegistry() = default;

    /**
     * Returns nullptr in case there is no usable adapter.
     **/
    virtual std::shared_ptr<Adapter> get_default_adapter() = 0;
    /**
     * Appends a snapshot of all cached devices to devices.
     * Returns false in case the cache could not be read.
     **/
    virtual bool list_cached_devices(std::vector<std::unique_ptr<Device>>* devices) = 0;
    /**
     * Returns nullptr in case the discovery could not be started.
     **/
    virtual std::unique_ptr<DiscoverySession> start_discovery() = 0;
    /**
     * Creates a device for the path of a DiscoveryEvent.
     * Returns nullptr in case the path is unknown.
     **/
    virtual std::unique_ptr<Device> new_device(const std::string& path) = 0;
};
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
