#include "FakeRegistry.hpp"
#include "bt_acquire/AcquisitionEngine.hpp"
#include "bt_acquire/DeviceManager.hpp"
#include "bt_acquire/MatchPredicate.hpp"
#include <atomic>
#include <catch2/catch.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {
const fake::DeviceSpec HEADPHONES{"00:11:22:33:44:01", "Headphones"};
const fake::DeviceSpec SPEAKER_KITCHEN{"00:11:22:33:44:02", "Speaker Kitchen"};
const fake::DeviceSpec SPEAKER_BATH{"00:11:22:33:44:03", "Speaker Bath"};

bt_acquire::SearchConfig speaker_search(std::chrono::milliseconds cooldown = std::chrono::milliseconds{10}) {
    bt_acquire::SearchConfig config;
    config.targetNamePattern = "^Speaker";
    config.retryCooldown = cooldown;
    return config;
}

bool wait_for_state(const bt_acquire::DeviceManager& manager, bt_acquire::ManagerState state) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (std::chrono::steady_clock::now() < deadline) {
        if (manager.get_state() == state) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return false;
}
}  // namespace

TEST_CASE("FirstMatchWins", "[acquisitionEngine]") {
    fake::FakeRegistry registry;
    registry.cached = {HEADPHONES, SPEAKER_KITCHEN, SPEAKER_BATH};
    bt_acquire::AcquisitionEngine engine(&registry);

    bt_acquire::MatchPredicate predicate;
    REQUIRE(bt_acquire::build_match_predicate(speaker_search(), &predicate) == bt_acquire::SUCCESS);
    std::unique_ptr<bt::Device> candidate;
    REQUIRE(engine.scan_cache(predicate, &candidate) == bt_acquire::SUCCESS);
    REQUIRE(candidate);
    REQUIRE(candidate->get_address() == SPEAKER_KITCHEN.addr);
    // The scan stops at the second device:
    REQUIRE(registry.get_stats(SPEAKER_BATH.addr)->propertyReads.load() == 0);
}

TEST_CASE("CacheMiss", "[acquisitionEngine]") {
    fake::FakeRegistry registry;
    registry.cached = {HEADPHONES};
    bt_acquire::AcquisitionEngine engine(&registry);

    bt_acquire::MatchPredicate predicate;
    REQUIRE(bt_acquire::build_match_predicate(speaker_search(), &predicate) == bt_acquire::SUCCESS);
    std::unique_ptr<bt::Device> candidate;
    REQUIRE(engine.scan_cache(predicate, &candidate) == bt_acquire::DEVICE_NOT_FOUND);
    REQUIRE_FALSE(candidate);
}

TEST_CASE("CacheListFailure", "[acquisitionEngine]") {
    fake::FakeRegistry registry;
    registry.cacheListFails = true;
    bt_acquire::AcquisitionEngine engine(&registry);

    bt_acquire::MatchPredicate predicate;
    REQUIRE(bt_acquire::build_match_predicate(speaker_search(), &predicate) == bt_acquire::SUCCESS);
    std::unique_ptr<bt::Device> candidate;
    REQUIRE(engine.scan_cache(predicate, &candidate) == bt_acquire::CACHE_LIST_FAILED);
}

TEST_CASE("DiscoveryFirstMatchWins", "[acquisitionEngine]") {
    fake::FakeRegistry registry;
    registry.discoverable = {{"/dev1", HEADPHONES}, {"/dev2", SPEAKER_KITCHEN}, {"/dev3", SPEAKER_BATH}};
    registry.discoveryEvents = {{bt::DiscoveryEventKind::PRESENT, "/dev1"},
                                {bt::DiscoveryEventKind::REMOVED, "/dev2"},
                                {bt::DiscoveryEventKind::PRESENT, "/dev3"},
                                {bt::DiscoveryEventKind::PRESENT, "/dev2"}};
    registry.keepDiscoveryOpen = true;
    bt_acquire::AcquisitionEngine engine(&registry);

    bt_acquire::MatchPredicate predicate;
    REQUIRE(bt_acquire::build_match_predicate(speaker_search(), &predicate) == bt_acquire::SUCCESS);

    std::mutex m;
    std::condition_variable cv;
    std::unique_ptr<bt::Device> candidate;
    bool failed = false;
    REQUIRE(engine.start_discovery(
                predicate,
                [&](std::unique_ptr<bt::Device>&& device) {
                    std::scoped_lock lk(m);
                    candidate = std::move(device);
                    cv.notify_all();
                },
                [&]() {
                    std::scoped_lock lk(m);
                    failed = true;
                    cv.notify_all();
                }) == bt_acquire::SUCCESS);

    {
        std::unique_lock<std::mutex> lk(m);
        REQUIRE(cv.wait_for(lk, std::chrono::seconds{5}, [&] { return candidate || failed; }));
    }
    engine.stop();
    REQUIRE_FALSE(failed);
    REQUIRE(candidate->get_address() == SPEAKER_BATH.addr);
    // The removed event must not be turned into a device and the last event is never read:
    REQUIRE(registry.newDeviceCalls.load() == 2);
    REQUIRE(registry.cancelCount.load() == 1);
}

TEST_CASE("ConnectFromCache", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {HEADPHONES, SPEAKER_KITCHEN};
    bt_acquire::DeviceManager manager(&registry);

    std::mutex statesMutex;
    std::vector<bt_acquire::ManagerState> states;
    manager.set_state_changed_event_handler([&](const bt_acquire::ManagerState& state) {
        std::scoped_lock lk(statesMutex);
        states.push_back(state);
    });

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(registry.adapter->powered.load());
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(manager.wait_for_connect());

    std::optional<bt_acquire::DeviceInfo> device = manager.get_connected_device();
    REQUIRE(device);
    REQUIRE(device->address == SPEAKER_KITCHEN.addr);
    REQUIRE(device->name == SPEAKER_KITCHEN.name);
    REQUIRE(registry.discoveryStarts.load() == 0);

    std::scoped_lock lk(statesMutex);
    REQUIRE(states == std::vector<bt_acquire::ManagerState>{bt_acquire::SCANNING_CACHE, bt_acquire::CONNECTING, bt_acquire::CONNECTED});
}

TEST_CASE("ConnectFromDiscovery", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {HEADPHONES};
    registry.discoverable = {{"/dev1", HEADPHONES}, {"/dev3", SPEAKER_BATH}};
    registry.discoveryEvents = {{bt::DiscoveryEventKind::PRESENT, "/dev1"},
                                {bt::DiscoveryEventKind::REMOVED, "/dev1"},
                                {bt::DiscoveryEventKind::PRESENT, "/dev3"}};
    registry.keepDiscoveryOpen = true;
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(manager.wait_for_connect(std::chrono::seconds{5}));
    REQUIRE(manager.get_connected_device()->address == SPEAKER_BATH.addr);
    REQUIRE(registry.discoveryStarts.load() == 1);
    REQUIRE(registry.cancelCount.load() == 1);
    manager.stop();
    REQUIRE(registry.cancelCount.load() == 1);
}

TEST_CASE("SkipFailedDeviceCreation", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.discoverable = {{"/dev2", SPEAKER_KITCHEN}};
    registry.discoveryEvents = {{bt::DiscoveryEventKind::PRESENT, "/unknown"},
                                {bt::DiscoveryEventKind::PRESENT, "/dev2"}};
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(manager.wait_for_connect(std::chrono::seconds{5}));
    REQUIRE(manager.get_connected_device()->address == SPEAKER_KITCHEN.addr);
    REQUIRE(registry.newDeviceCalls.load() == 2);
}

TEST_CASE("DiscoveryEndsWithoutMatch", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.discoverable = {{"/dev1", HEADPHONES}};
    registry.discoveryEvents = {{bt::DiscoveryEventKind::PRESENT, "/dev1"}};
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(wait_for_state(manager, bt_acquire::IDLE));
    REQUIRE(registry.cancelCount.load() == 1);
    REQUIRE_FALSE(manager.wait_for_connect(std::chrono::milliseconds{50}));
    REQUIRE(manager.get_connect_attempt_count() == 0);

    // A new search is possible afterwards:
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(wait_for_state(manager, bt_acquire::IDLE));
    REQUIRE(registry.discoveryStarts.load() == 2);
    REQUIRE(registry.cancelCount.load() == 2);
}

TEST_CASE("DiscoveryStartFailure", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {HEADPHONES};
    registry.discoveryStartFails = true;
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::DISCOVERY_START_FAILED);
    REQUIRE(manager.get_state() == bt_acquire::IDLE);
    REQUIRE(manager.get_connect_attempt_count() == 0);
    REQUIRE(registry.get_stats(HEADPHONES.addr)->connectCalls.load() == 0);
}

TEST_CASE("RetryWithCooldown", "[deviceManager]") {
    fake::FakeRegistry registry;
    fake::DeviceSpec flaky = SPEAKER_KITCHEN;
    flaky.connectFailures = 2;
    registry.cached = {flaky};
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    const auto start = std::chrono::steady_clock::now();
    REQUIRE(manager.search_and_connect(speaker_search(std::chrono::milliseconds{50})) == bt_acquire::SUCCESS);
    REQUIRE(manager.wait_for_connect());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= std::chrono::milliseconds{100});
    REQUIRE(manager.get_connect_attempt_count() == 3);
    REQUIRE(registry.get_stats(flaky.addr)->connectCalls.load() == 3);
}

TEST_CASE("MultipleWaiters", "[deviceManager]") {
    fake::FakeRegistry registry;
    fake::DeviceSpec flaky = SPEAKER_KITCHEN;
    flaky.connectFailures = 1;
    registry.cached = {flaky};
    bt_acquire::DeviceManager manager(&registry);
    REQUIRE(manager.init() == bt_acquire::SUCCESS);

    std::atomic_size_t connectedCount{0};
    std::vector<std::thread> waiters;
    for (size_t i = 0; i < 3; i++) {
        waiters.emplace_back([&]() {
            if (manager.wait_for_connect()) {
                connectedCount++;
            }
        });
    }
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    for (std::thread& waiter : waiters) {
        waiter.join();
    }
    REQUIRE(connectedCount.load() == 3);
    // Waiting again after the connection got established returns right away:
    REQUIRE(manager.wait_for_connect());
    REQUIRE(manager.wait_for_connect(std::chrono::milliseconds{0}));
}

TEST_CASE("StopWhileConnecting", "[deviceManager]") {
    fake::FakeRegistry registry;
    fake::DeviceSpec unreachable = SPEAKER_KITCHEN;
    unreachable.connectFailures = fake::NEVER_CONNECTS;
    registry.cached = {unreachable};
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search(std::chrono::seconds{60})) == bt_acquire::SUCCESS);
    REQUIRE(manager.get_state() == bt_acquire::CONNECTING);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::ALREADY_STARTED);

    std::atomic_bool waitResult{true};
    std::thread waiter([&]() { waitResult = manager.wait_for_connect(); });
    const auto start = std::chrono::steady_clock::now();
    manager.stop();
    waiter.join();
    REQUIRE_FALSE(waitResult.load());
    // The cooldown got interrupted:
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds{30});
    REQUIRE(manager.get_state() == bt_acquire::STOPPED);
    REQUIRE_FALSE(manager.get_connected_device());
}

TEST_CASE("StopWhileDiscovering", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.keepDiscoveryOpen = true;
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(manager.get_state() == bt_acquire::SCANNING_DISCOVERY);
    manager.stop();
    REQUIRE(registry.cancelCount.load() == 1);
    REQUIRE(manager.get_state() == bt_acquire::STOPPED);
    REQUIRE_FALSE(manager.wait_for_connect());
}

TEST_CASE("StopWhileScanningCache", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {SPEAKER_KITCHEN};
    bt_acquire::DeviceManager manager(&registry);
    registry.onListCachedDevices = [&manager]() { manager.stop(); };

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SEARCH_STOPPED);
    REQUIRE(manager.get_state() == bt_acquire::STOPPED);
    REQUIRE(manager.get_connect_attempt_count() == 0);
    REQUIRE(registry.get_stats(SPEAKER_KITCHEN.addr)->connectCalls.load() == 0);
    REQUIRE(registry.discoveryStarts.load() == 0);
}

TEST_CASE("StopWhileStartingDiscovery", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.keepDiscoveryOpen = true;
    registry.discoveryWakeDelay = std::chrono::milliseconds{20};
    bt_acquire::DeviceManager manager(&registry);

    // stop() runs on a second thread while search_and_connect() is still starting the discovery:
    std::optional<std::thread> stopper;
    registry.onStartDiscovery = [&]() {
        stopper = std::make_optional<std::thread>([&manager]() { manager.stop(); });
        wait_for_state(manager, bt_acquire::STOPPED);
    };

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SEARCH_STOPPED);
    REQUIRE(stopper);
    stopper->join();

    REQUIRE(manager.get_state() == bt_acquire::STOPPED);
    REQUIRE(registry.discoveryStarts.load() == 1);
    REQUIRE(registry.cancelCount.load() == 1);
    REQUIRE_FALSE(manager.wait_for_connect());
}

TEST_CASE("ConcurrentEngineStop", "[acquisitionEngine]") {
    fake::FakeRegistry registry;
    registry.keepDiscoveryOpen = true;
    registry.discoveryWakeDelay = std::chrono::milliseconds{20};
    bt_acquire::AcquisitionEngine engine(&registry);

    bt_acquire::MatchPredicate predicate;
    REQUIRE(bt_acquire::build_match_predicate(speaker_search(), &predicate) == bt_acquire::SUCCESS);
    std::atomic_size_t callbacks{0};
    REQUIRE(engine.start_discovery(
                std::move(predicate),
                [&callbacks](std::unique_ptr<bt::Device>&& /*device*/) { callbacks++; },
                [&callbacks]() { callbacks++; }) == bt_acquire::SUCCESS);

    std::vector<std::thread> stoppers;
    for (size_t i = 0; i < 3; i++) {
        stoppers.emplace_back([&engine]() { engine.stop(); });
    }
    for (std::thread& stopper : stoppers) {
        stopper.join();
    }
    REQUIRE(registry.cancelCount.load() == 1);
    REQUIRE(callbacks.load() == 0);
}

TEST_CASE("StopAfterConnected", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {SPEAKER_KITCHEN};
    bt_acquire::DeviceManager manager(&registry);

    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::SUCCESS);
    REQUIRE(manager.wait_for_connect());
    manager.stop();
    REQUIRE(manager.get_state() == bt_acquire::CONNECTED);
    REQUIRE(manager.wait_for_connect());
}

TEST_CASE("NotInitialized", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {SPEAKER_KITCHEN};
    bt_acquire::DeviceManager manager(&registry);
    REQUIRE(manager.search_and_connect(speaker_search()) == bt_acquire::NOT_INITIALIZED);
    REQUIRE(manager.get_state() == bt_acquire::IDLE);
}

TEST_CASE("AdapterUnavailable", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.adapter = nullptr;
    bt_acquire::DeviceManager manager(&registry);
    REQUIRE(manager.init() == bt_acquire::ADAPTER_UNAVAILABLE);
    REQUIRE_FALSE(manager.get_adapter());
}

TEST_CASE("AdapterPowerFailure", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.adapter->powerOnFails = true;
    bt_acquire::DeviceManager manager(&registry);
    REQUIRE(manager.init() == bt_acquire::ADAPTER_POWER_FAILED);

    // The init step can be retried:
    registry.adapter->powerOnFails = false;
    REQUIRE(manager.init() == bt_acquire::SUCCESS);
    REQUIRE(manager.get_adapter());
}

TEST_CASE("InvalidSearch", "[deviceManager]") {
    fake::FakeRegistry registry;
    registry.cached = {SPEAKER_KITCHEN};
    bt_acquire::DeviceManager manager(&registry);
    REQUIRE(manager.init() == bt_acquire::SUCCESS);

    bt_acquire::SearchConfig config;
    REQUIRE(manager.search_and_connect(config) == bt_acquire::MISSING_CRITERION);
    config.targetNamePattern = "[";
    REQUIRE(manager.search_and_connect(config) == bt_acquire::INVALID_PATTERN);
    config.targetAddress = "00:11:22";
    REQUIRE(manager.search_and_connect(config) == bt_acquire::INVALID_ADDRESS);
    REQUIRE(manager.get_state() == bt_acquire::IDLE);
    REQUIRE(registry.get_stats(SPEAKER_KITCHEN.addr)->propertyReads.load() == 0);
}
