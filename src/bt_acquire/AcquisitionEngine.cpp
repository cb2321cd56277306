#include "bt_acquire/AcquisitionEngine.hpp"
#include <cassert>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
AcquisitionEngine::AcquisitionEngine(bt::DeviceRegistry* registry) : registry(registry) {
    assert(registry);
}

AcquisitionEngine::~AcquisitionEngine() {
    stop();
}

AcquireResult AcquisitionEngine::scan_cache(const MatchPredicate& predicate, std::unique_ptr<bt::Device>* candidate) {
    std::vector<std::unique_ptr<bt::Device>> devices;
    if (!registry->list_cached_devices(&devices)) {
        SPDLOG_ERROR("Failed to list the cached devices.");
        return CACHE_LIST_FAILED;
    }

    for (std::unique_ptr<bt::Device>& device : devices) {
        if (predicate(device->get_address(), device->get_name())) {
            SPDLOG_INFO("Found requested device in cache: (addr={}, name={})", device->get_address(), device->get_name());
            *candidate = std::move(device);
            return SUCCESS;
        }
        SPDLOG_DEBUG("Found non-matching device: (addr={}, name={})", device->get_address(), device->get_name());
    }
    return DEVICE_NOT_FOUND;
}

AcquireResult AcquisitionEngine::start_discovery(MatchPredicate predicate, OnCandidateFoundFunc onCandidateFound, OnDiscoveryFailedFunc onDiscoveryFailed) {
    // A previous discovery has to be completely finished:
    stop();

    std::unique_ptr<bt::DiscoverySession> session = registry->start_discovery();
    if (!session) {
        SPDLOG_ERROR("Failed to start the device discovery.");
        return DISCOVERY_START_FAILED;
    }

    std::scoped_lock lk(discoveryMutex);
    activeSession = session.get();
    discoveryRunning = true;
    discoveryThread = std::make_optional<std::thread>(&AcquisitionEngine::discovery_run, this, std::move(session), std::move(predicate), std::move(onCandidateFound), std::move(onDiscoveryFailed));
    return SUCCESS;
}

void AcquisitionEngine::discovery_run(std::unique_ptr<bt::DiscoverySession> session, const MatchPredicate& predicate, const OnCandidateFoundFunc& onCandidateFound, const OnDiscoveryFailedFunc& onDiscoveryFailed) {
    SPDLOG_INFO("Could not find device in cache, discovering...");
    std::unique_ptr<bt::Device> candidate{nullptr};
    while (std::optional<bt::DiscoveryEvent> event = session->next_event()) {
        if (event->kind == bt::DiscoveryEventKind::REMOVED) {
            continue;
        }

        std::unique_ptr<bt::Device> device = registry->new_device(event->path);
        if (!device) {
            SPDLOG_WARN("Failed to create a device for '{}'. Skipping it.", event->path);
            continue;
        }

        if (predicate(device->get_address(), device->get_name())) {
            SPDLOG_INFO("Found requested device: (addr={}, name={})", device->get_address(), device->get_name());
            candidate = std::move(device);
            break;
        }
        SPDLOG_DEBUG("Found non-matching device: (addr={}, name={})", device->get_address(), device->get_name());
    }

    if (!cancel_discovery(session.get())) {
        // stop() got called in the meantime:
        SPDLOG_DEBUG("Discovery stopped.");
    } else if (candidate) {
        onCandidateFound(std::move(candidate));
    } else {
        SPDLOG_ERROR("Discovery ended without finding the requested device.");
        onDiscoveryFailed();
    }
    session.reset();

    std::scoped_lock lk(discoveryMutex);
    discoveryRunning = false;
    discoveryCv.notify_all();
}

bool AcquisitionEngine::cancel_discovery(bt::DiscoverySession* session) {
    std::scoped_lock lk(discoveryMutex);
    if (!activeSession || activeSession != session) {
        return false;
    }
    activeSession->cancel();
    activeSession = nullptr;
    return true;
}

void AcquisitionEngine::stop() {
    std::unique_lock<std::mutex> lk(discoveryMutex);
    if (activeSession) {
        activeSession->cancel();
        activeSession = nullptr;
    }
    std::optional<std::thread> thread = std::move(discoveryThread);
    discoveryThread.reset();
    lk.unlock();
    if (thread && thread->joinable()) {
        assert(thread->get_id() != std::this_thread::get_id());
        thread->join();
    }

    // Another caller might still be joining the discovery thread:
    lk.lock();
    discoveryCv.wait(lk, [this] { return !discoveryRunning; });
}
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
