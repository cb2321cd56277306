#pragma once

#include "bt/DeviceRegistry.hpp"
#include "bt_acquire/AcquireResult.hpp"
#include "bt_acquire/AcquisitionEngine.hpp"
#include "bt_acquire/ConnectRetryLoop.hpp"
#include "bt_acquire/SearchConfig.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
enum ManagerState {
    IDLE,
    SCANNING_CACHE,
    SCANNING_DISCOVERY,
    CONNECTING,
    CONNECTED,
    STOPPED
};

[[nodiscard]] const char* to_string(ManagerState state);

struct DeviceInfo {
    std::string address{};
    std::string name{};
} __attribute__((aligned(64)));

/**
 * Searches for a single device and connects to it once found.
 *
 * IDLE -> SCANNING_CACHE -> CONNECTING -> CONNECTED
 *                       \-> SCANNING_DISCOVERY -> CONNECTING -> CONNECTED
 *                                             \-> IDLE (discovery ended without a match)
 * Every state besides CONNECTED can go to STOPPED.
 **/
class DeviceManager {
 public:
    /**
     * Invoked while holding the internal lock.
     * Must not call back into the DeviceManager.
     **/
    using StateChangedEventHandler = std::function<void(const ManagerState&)>;

 private:
    bt::DeviceRegistry* registry;
    AcquisitionEngine engine;

    mutable std::mutex m;
    std::condition_variable stateCv;
    ManagerState state{ManagerState::IDLE};
    std::shared_ptr<bt::Adapter> adapter{nullptr};

    std::unique_ptr<ConnectRetryLoop> retryLoop{nullptr};
    std::optional<std::thread> retryThread{std::nullopt};
    std::optional<DeviceInfo> connectedDevice{std::nullopt};

    std::unique_ptr<StateChangedEventHandler> stateChangedEventHandler{nullptr};

 public:
    explicit DeviceManager(bt::DeviceRegistry* registry);
    DeviceManager(DeviceManager&&) = delete;
    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(DeviceManager&&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;
    ~DeviceManager();

    /**
     * Acquires the default adapter and powers it on.
     * Has to succeed once before search_and_connect() can be used. Can be retried on failure.
     **/
    AcquireResult init();
    /**
     * Searches the cache for the device described by config and falls back to a discovery in case it is not cached.
     * Returns SUCCESS as soon as either a connection attempt started or a discovery is running.
     * Returns SEARCH_STOPPED in case stop() got called before that.
     * Does not block until the device is connected, use wait_for_connect() for that.
     **/
    AcquireResult search_and_connect(const SearchConfig& config);
    /**
     * Blocks until the device got connected (returns true) or the manager got stopped (returns false).
     * Can be called any number of times and from multiple threads.
     **/
    bool wait_for_connect();
    /**
     * Same as wait_for_connect() but returns false in case the timeout elapsed.
     **/
    bool wait_for_connect(std::chrono::milliseconds timeout);
    /**
     * Cancels a running discovery and connection attempts and waits for them to finish.
     * Has no effect once the device is connected.
     **/
    void stop();

    [[nodiscard]] ManagerState get_state() const;
    /**
     * Address and name of the connected device.
     * std::nullopt until CONNECTED.
     **/
    [[nodiscard]] std::optional<DeviceInfo> get_connected_device() const;
    /**
     * The number of connection attempts made so far.
     **/
    [[nodiscard]] size_t get_connect_attempt_count() const;
    [[nodiscard]] std::shared_ptr<bt::Adapter> get_adapter() const;

    void set_state_changed_event_handler(StateChangedEventHandler handler);
    void clear_state_changed_event_handler();

 private:
    /**
     * Requires m to be locked.
     **/
    void set_state(ManagerState newState);
    /**
     * Hands the device over to a new retry loop thread.
     * Requires m to be locked.
     **/
    void start_connecting(std::unique_ptr<bt::Device>&& device, std::chrono::milliseconds cooldown);
    void on_candidate_found(std::unique_ptr<bt::Device>&& device, std::chrono::milliseconds cooldown);
    void on_discovery_failed();
    /**
     * Entry point of the retry loop thread.
     **/
    void retry_run();
};
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
