#include "bt_acquire/ConnectRetryLoop.hpp"
#include <cassert>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
ConnectRetryLoop::ConnectRetryLoop(std::unique_ptr<bt::Device>&& device, std::chrono::milliseconds cooldown) : device(std::move(device)),
                                                                                                                cooldown(cooldown) {
    assert(this->device);
}

bool ConnectRetryLoop::run() {
    SPDLOG_INFO("Attempting to connect to '{}' indefinitely...", device->get_address());
    while (true) {
        std::unique_lock<std::mutex> lk(m);
        if (canceled) {
            SPDLOG_INFO("Connecting to '{}' canceled after {} attempts.", device->get_address(), attemptCount);
            return false;
        }
        attemptCount++;
        lk.unlock();

        if (device->connect()) {
            break;
        }
        SPDLOG_DEBUG("Connection attempt {} to '{}' failed. Retrying in {} ms...", attemptCount, device->get_address(), cooldown.count());

        lk.lock();
        cv.wait_for(lk, cooldown, [this] { return canceled; });
    }
    SPDLOG_INFO("Connection to Bluetooth device '{}' ({}) succeeded.", device->get_name(), device->get_address());
    return true;
}

void ConnectRetryLoop::cancel() {
    std::unique_lock<std::mutex> lk(m);
    canceled = true;
    lk.unlock();
    cv.notify_all();
}

size_t ConnectRetryLoop::get_attempt_count() {
    std::scoped_lock lk(m);
    return attemptCount;
}

const bt::Device& ConnectRetryLoop::get_device() const {
    return *device;
}
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
