#include <gattlib.h>  // Include first since we have some structs forward declared

#include "bt/BLEDevice.hpp"
#include <array>
#include <cstdlib>
#include <string>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
BLEDevice::BLEDevice(std::string&& name, std::string&& addr) : name(std::move(name)),
                                                                addr(std::move(addr)) {}

BLEDevice::~BLEDevice() {
    disconnect();
}

const std::string& BLEDevice::get_address() const {
    return addr;
}

const std::string& BLEDevice::get_name() const {
    return name;
}

bool BLEDevice::connect() {
    if (connected) {
        return true;
    }
    // Release what a remote disconnect left behind:
    disconnect();

    connection = gattlib_connect(nullptr, addr.c_str(), GATTLIB_CONNECTION_OPTIONS_LEGACY_DEFAULT);
    if (!connection) {
        SPDLOG_DEBUG("gattlib_connect() to '{}' failed.", addr);
        return false;
    }

    int result = gattlib_discover_primary(connection, &services, &serviceCount);
    if (result != GATTLIB_SUCCESS || serviceCount <= 0) {
        SPDLOG_ERROR("BLE device GATT discovery failed with error code {}.", result);
        result = gattlib_disconnect(connection);
        if (result != GATTLIB_SUCCESS) {
            SPDLOG_ERROR("BLE device disconnect failed with error code {}.", result);
        }
        connection = nullptr;
        // NOLINTNEXTLINE (cppcoreguidelines-no-malloc)
        free(services);
        services = nullptr;
        serviceCount = 0;
        return false;
    }

    std::array<char, MAX_LEN_UUID_STR + 1> uuidStr{};
    for (int i = 0; i < serviceCount; i++) {
        // NOLINTNEXTLINE (cppcoreguidelines-pro-bounds-pointer-arithmetic)
        gattlib_uuid_to_string(&services[i].uuid, uuidStr.data(), uuidStr.size());
        SPDLOG_TRACE("Found service with UUID: {}", uuidStr.data());
    }
    SPDLOG_DEBUG("Discovered {} services.", serviceCount);
    gattlib_register_on_disconnect(connection, &BLEDevice::on_disconnected, this);
    connected = true;
    SPDLOG_DEBUG("BLEDevice '{}' connected.", addr);
    return true;
}

void BLEDevice::disconnect() {
    if (!connection) {
        return;
    }
    connected = false;
    int result = gattlib_disconnect(connection);
    if (result != GATTLIB_SUCCESS) {
        SPDLOG_WARN("BLE device disconnect failed with error code {}.", result);
    }
    connection = nullptr;
    // NOLINTNEXTLINE (cppcoreguidelines-no-malloc)
    free(services);
    services = nullptr;
    serviceCount = 0;
}

bool BLEDevice::is_connected() const {
    return connected;
}

int BLEDevice::get_service_count() const {
    return serviceCount;
}

void BLEDevice::set_disconnected_event_handler(OnDisconnectedFunc handler) {
    onDisconnected = std::move(handler);
}

void BLEDevice::on_disconnected(void* arg) {
    BLEDevice* device = static_cast<BLEDevice*>(arg);
    if (device->connected.exchange(false)) {
        SPDLOG_DEBUG("BLEDevice '{}' disconnected.", device->addr);
        if (device->onDisconnected) {
            device->onDisconnected();
        }
    }
}
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
