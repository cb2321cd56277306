#include "bt/HciAdapter.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
constexpr const char* DEFAULT_ADAPTER_NAME = "hci0";

HciAdapter::HciAdapter(int devId, std::string&& name) : devId(devId), name(std::move(name)) {}

std::shared_ptr<HciAdapter> HciAdapter::open(const std::string& name) {
    int devId = -1;
    if (name.empty()) {
        // hci_get_route() only finds adapters that are up:
        devId = hci_get_route(nullptr);
        if (devId < 0) {
            devId = hci_devid(DEFAULT_ADAPTER_NAME);
        }
    } else {
        devId = hci_devid(name.c_str());
    }
    if (devId < 0) {
        SPDLOG_ERROR("No Bluetooth adapter '{}' found.", name.empty() ? DEFAULT_ADAPTER_NAME : name);
        return nullptr;
    }

    hci_dev_info info{};
    if (hci_devinfo(devId, &info) < 0) {
        SPDLOG_ERROR("Failed to read info of Bluetooth adapter {} with: {}", devId, std::strerror(errno));
        return nullptr;
    }
    return std::make_shared<HciAdapter>(devId, std::string{static_cast<const char*>(info.name)});
}

std::string HciAdapter::get_name() const {
    return name;
}

bool HciAdapter::set_powered(bool powered) {
    int ctl = socket(AF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC, BTPROTO_HCI);
    if (ctl < 0) {
        SPDLOG_ERROR("Failed to open HCI control socket with: {}", std::strerror(errno));
        return false;
    }

    bool success = true;
    // NOLINTNEXTLINE (cppcoreguidelines-pro-type-vararg)
    if (ioctl(ctl, powered ? HCIDEVUP : HCIDEVDOWN, devId) < 0) {
        // Already up:
        if (!powered || errno != EALREADY) {
            SPDLOG_ERROR("Failed to power {} Bluetooth adapter '{}' with: {}", powered ? "on" : "off", name, std::strerror(errno));
            success = false;
        }
    }
    close(ctl);
    return success;
}

std::optional<std::string> HciAdapter::get_address() const {
    bdaddr_t bdaddr{};
    if (hci_devba(devId, &bdaddr) < 0) {
        SPDLOG_ERROR("Failed to read the address of Bluetooth adapter '{}' with: {}", name, std::strerror(errno));
        return std::nullopt;
    }
    std::array<char, 18> addrStr{};
    ba2str(&bdaddr, addrStr.data());
    return std::string{addrStr.data()};
}

int HciAdapter::get_dev_id() const {
    return devId;
}
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
