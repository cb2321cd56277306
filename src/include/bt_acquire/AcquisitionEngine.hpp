#pragma once

#include "bt/DeviceRegistry.hpp"
#include "bt_acquire/AcquireResult.hpp"
#include "bt_acquire/MatchPredicate.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
/**
 * Finds the first device matching a MatchPredicate.
 * The cache gets searched synchronously, a discovery runs on a background thread.
 **/
class AcquisitionEngine {
 public:
    /**
     * Invoked from the discovery thread with the first matching device.
     **/
    using OnCandidateFoundFunc = std::function<void(std::unique_ptr<bt::Device>&&)>;
    /**
     * Invoked from the discovery thread in case the discovery ended without a match.
     **/
    using OnDiscoveryFailedFunc = std::function<void()>;

 private:
    bt::DeviceRegistry* registry;

    std::mutex discoveryMutex;
    std::condition_variable discoveryCv;
    /**
     * Owned by the discovery thread.
     * Set until either stop() or the discovery thread canceled it.
     **/
    bt::DiscoverySession* activeSession{nullptr};
    bool discoveryRunning{false};
    std::optional<std::thread> discoveryThread{std::nullopt};

 public:
    explicit AcquisitionEngine(bt::DeviceRegistry* registry);
    AcquisitionEngine(AcquisitionEngine&&) = delete;
    AcquisitionEngine(const AcquisitionEngine&) = delete;
    AcquisitionEngine& operator=(AcquisitionEngine&&) = delete;
    AcquisitionEngine& operator=(const AcquisitionEngine&) = delete;
    ~AcquisitionEngine();

    /**
     * Evaluates the predicate for all cached devices in the order the registry lists them.
     * Stops at the first match and moves it into candidate.
     * Returns DEVICE_NOT_FOUND in case no cached device matches.
     **/
    AcquireResult scan_cache(const MatchPredicate& predicate, std::unique_ptr<bt::Device>* candidate);
    /**
     * Starts a discovery and evaluates the predicate for every device it reports on a background thread.
     * Only the start of the discovery is synchronous, DISCOVERY_START_FAILED is returned in case that fails.
     * The discovery gets canceled exactly once, before onCandidateFound or onDiscoveryFailed get invoked.
     * Neither of them gets invoked in case stop() ended the discovery.
     **/
    AcquireResult start_discovery(MatchPredicate predicate, OnCandidateFoundFunc onCandidateFound, OnDiscoveryFailedFunc onDiscoveryFailed);
    /**
     * Cancels a running discovery and waits for the discovery thread to finish.
     * Can be called concurrently. Must not be called from the discovery thread.
     **/
    void stop();

 private:
    /**
     * Entry point of the discovery thread.
     **/
    void discovery_run(std::unique_ptr<bt::DiscoverySession> session, const MatchPredicate& predicate, const OnCandidateFoundFunc& onCandidateFound, const OnDiscoveryFailedFunc& onDiscoveryFailed);
    /**
     * Cancels the given session in case it is still the active one.
     * Returns false in case stop() canceled it before.
     **/
    bool cancel_discovery(bt::DiscoverySession* session);
};
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
