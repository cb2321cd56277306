#pragma once

#include "bt/DeviceRegistry.hpp"
#include "gattlib.h"
#include <atomic>
#include <functional>
#include <string>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
/**
 * A Bluetooth LE device accessed via gattlib.
 **/
class BLEDevice : public Device {
 public:
    using OnDisconnectedFunc = std::function<void()>;

 private:
    const std::string name;
    const std::string addr;

    OnDisconnectedFunc onDisconnected{nullptr};

    gatt_connection_t* connection{nullptr};
    int serviceCount{0};
    gattlib_primary_service_t* services{nullptr};

    std::atomic_bool connected{false};

 public:
    BLEDevice(std::string&& name, std::string&& addr);
    BLEDevice(BLEDevice&&) = delete;
    BLEDevice(const BLEDevice&) = delete;
    BLEDevice& operator=(BLEDevice&&) = delete;
    BLEDevice& operator=(const BLEDevice&) = delete;
    ~BLEDevice() override;

    [[nodiscard]] const std::string& get_address() const override;
    [[nodiscard]] const std::string& get_name() const override;
    /**
     * Connects and discovers the primary services.
     * Counts as failed in case no service could be discovered.
     **/
    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;
    [[nodiscard]] int get_service_count() const;

    void set_disconnected_event_handler(OnDisconnectedFunc handler);

 private:
    static void on_disconnected(void* arg);
};
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
