#pragma once

#include "bt/DeviceRegistry.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
/**
 * Tries to connect to a single device until it succeeds.
 * Waits a constant cooldown between two attempts and has no upper limit for the number of attempts.
 **/
class ConnectRetryLoop {
 private:
    const std::unique_ptr<bt::Device> device;
    const std::chrono::milliseconds cooldown;

    std::mutex m;
    std::condition_variable cv;
    bool canceled{false};
    size_t attemptCount{0};

 public:
    ConnectRetryLoop(std::unique_ptr<bt::Device>&& device, std::chrono::milliseconds cooldown);
    ConnectRetryLoop(ConnectRetryLoop&&) = delete;
    ConnectRetryLoop(const ConnectRetryLoop&) = delete;
    ConnectRetryLoop& operator=(ConnectRetryLoop&&) = delete;
    ConnectRetryLoop& operator=(const ConnectRetryLoop&) = delete;
    ~ConnectRetryLoop() = default;

    /**
     * Blocks until connected (returns true) or canceled (returns false).
     * A running connect attempt can not be interrupted, cancel() takes effect after it returned.
     **/
    bool run();
    /**
     * Interrupts the cooldown and makes run() return false.
     **/
    void cancel();
    [[nodiscard]] size_t get_attempt_count();
    [[nodiscard]] const bt::Device& get_device() const;
};
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
