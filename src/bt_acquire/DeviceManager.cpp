#include "bt_acquire/DeviceManager.hpp"
#include "bt_acquire/MatchPredicate.hpp"
#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
const char* to_string(ManagerState state) {
    switch (state) {
        case IDLE:
            return "idle";
        case SCANNING_CACHE:
            return "scanning cache";
        case SCANNING_DISCOVERY:
            return "scanning discovery";
        case CONNECTING:
            return "connecting";
        case CONNECTED:
            return "connected";
        case STOPPED:
            return "stopped";
    }
    return "unknown";
}

DeviceManager::DeviceManager(bt::DeviceRegistry* registry) : registry(registry), engine(registry) {}

DeviceManager::~DeviceManager() {
    stop();
}

AcquireResult DeviceManager::init() {
    std::scoped_lock lk(m);
    if (adapter) {
        return SUCCESS;
    }

    std::shared_ptr<bt::Adapter> defaultAdapter = registry->get_default_adapter();
    if (!defaultAdapter) {
        SPDLOG_ERROR("Error getting default Bluetooth adapter.");
        return ADAPTER_UNAVAILABLE;
    }
    SPDLOG_DEBUG("Default Bluetooth adapter: {}", defaultAdapter->get_name());

    if (!defaultAdapter->set_powered(true)) {
        SPDLOG_ERROR("Error powering on Bluetooth adapter '{}'.", defaultAdapter->get_name());
        return ADAPTER_POWER_FAILED;
    }
    SPDLOG_DEBUG("Powered on Bluetooth adapter.");
    adapter = std::move(defaultAdapter);
    return SUCCESS;
}

AcquireResult DeviceManager::search_and_connect(const SearchConfig& config) {
    MatchPredicate predicate;
    {
        std::scoped_lock lk(m);
        if (!adapter) {
            SPDLOG_ERROR("Unable to search. The adapter is not initialized.");
            return NOT_INITIALIZED;
        }
        if (state != ManagerState::IDLE) {
            SPDLOG_ERROR("Unable to search. Current state: {}", to_string(state));
            return ALREADY_STARTED;
        }

        AcquireResult result = build_match_predicate(config, &predicate);
        if (result != SUCCESS) {
            return result;
        }
        set_state(ManagerState::SCANNING_CACHE);
    }

    const std::chrono::milliseconds cooldown = config.retryCooldown;
    SPDLOG_INFO("Searching the device cache...");
    std::unique_ptr<bt::Device> candidate{nullptr};
    AcquireResult result = engine.scan_cache(predicate, &candidate);

    std::unique_lock<std::mutex> lk(m);
    if (state == ManagerState::STOPPED) {
        SPDLOG_DEBUG("Stopped while searching the device cache.");
        return SEARCH_STOPPED;
    }
    if (result == SUCCESS) {
        start_connecting(std::move(candidate), cooldown);
        return SUCCESS;
    }
    if (result != DEVICE_NOT_FOUND) {
        set_state(ManagerState::IDLE);
        return result;
    }
    set_state(ManagerState::SCANNING_DISCOVERY);
    lk.unlock();

    result = engine.start_discovery(
        std::move(predicate),
        [this, cooldown](std::unique_ptr<bt::Device>&& device) { this->on_candidate_found(std::move(device), cooldown); },
        [this]() { this->on_discovery_failed(); });

    lk.lock();
    if (result != SUCCESS) {
        if (state == ManagerState::SCANNING_DISCOVERY) {
            set_state(ManagerState::IDLE);
        }
        return result;
    }
    if (state == ManagerState::STOPPED) {
        // stop() might not have seen the discovery yet:
        lk.unlock();
        engine.stop();
        SPDLOG_DEBUG("Stopped while starting the discovery.");
        return SEARCH_STOPPED;
    }
    return SUCCESS;
}

void DeviceManager::on_candidate_found(std::unique_ptr<bt::Device>&& device, std::chrono::milliseconds cooldown) {
    std::scoped_lock lk(m);
    if (state != ManagerState::SCANNING_DISCOVERY) {
        SPDLOG_DEBUG("Dropping discovered device '{}' since the manager is {}.", device->get_address(), to_string(state));
        return;
    }
    start_connecting(std::move(device), cooldown);
}

void DeviceManager::on_discovery_failed() {
    std::scoped_lock lk(m);
    if (state == ManagerState::SCANNING_DISCOVERY) {
        set_state(ManagerState::IDLE);
    }
}

void DeviceManager::start_connecting(std::unique_ptr<bt::Device>&& device, std::chrono::milliseconds cooldown) {
    // There is never more than one retry loop per manager:
    assert(!retryLoop);
    assert(!retryThread);
    retryLoop = std::make_unique<ConnectRetryLoop>(std::move(device), cooldown);
    set_state(ManagerState::CONNECTING);
    retryThread = std::make_optional<std::thread>(&DeviceManager::retry_run, this);
}

void DeviceManager::retry_run() {
    // retryLoop does not change until the thread got joined:
    const bool success = retryLoop->run();

    std::scoped_lock lk(m);
    if (success && state == ManagerState::CONNECTING) {
        const bt::Device& device = retryLoop->get_device();
        connectedDevice = std::make_optional<DeviceInfo>(DeviceInfo{device.get_address(), device.get_name()});
        set_state(ManagerState::CONNECTED);
    }
}

bool DeviceManager::wait_for_connect() {
    std::unique_lock<std::mutex> lk(m);
    stateCv.wait(lk, [this] { return state == ManagerState::CONNECTED || state == ManagerState::STOPPED; });
    return state == ManagerState::CONNECTED;
}

bool DeviceManager::wait_for_connect(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m);
    stateCv.wait_for(lk, timeout, [this] { return state == ManagerState::CONNECTED || state == ManagerState::STOPPED; });
    return state == ManagerState::CONNECTED;
}

void DeviceManager::stop() {
    std::unique_lock<std::mutex> lk(m);
    if (state != ManagerState::CONNECTED) {
        set_state(ManagerState::STOPPED);
    }
    lk.unlock();

    engine.stop();

    lk.lock();
    ConnectRetryLoop* loop = retryLoop.get();
    std::optional<std::thread> thread = std::move(retryThread);
    retryThread.reset();
    lk.unlock();

    if (loop) {
        loop->cancel();
    }
    if (thread && thread->joinable()) {
        thread->join();
    }
}

ManagerState DeviceManager::get_state() const {
    std::scoped_lock lk(m);
    return state;
}

std::optional<DeviceInfo> DeviceManager::get_connected_device() const {
    std::scoped_lock lk(m);
    return connectedDevice;
}

size_t DeviceManager::get_connect_attempt_count() const {
    std::scoped_lock lk(m);
    if (!retryLoop) {
        return 0;
    }
    return retryLoop->get_attempt_count();
}

std::shared_ptr<bt::Adapter> DeviceManager::get_adapter() const {
    std::scoped_lock lk(m);
    return adapter;
}

void DeviceManager::set_state_changed_event_handler(StateChangedEventHandler handler) {
    std::scoped_lock lk(m);
    stateChangedEventHandler = std::make_unique<StateChangedEventHandler>(std::move(handler));
}

void DeviceManager::clear_state_changed_event_handler() {
    std::scoped_lock lk(m);
    stateChangedEventHandler = nullptr;
}

void DeviceManager::set_state(ManagerState newState) {
    if (state == newState) {
        return;
    }
    SPDLOG_DEBUG("Manager state: {} -> {}", to_string(state), to_string(newState));
    state = newState;
    stateCv.notify_all();

    if (stateChangedEventHandler) {
        (*stateChangedEventHandler)(state);
    }
}
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
