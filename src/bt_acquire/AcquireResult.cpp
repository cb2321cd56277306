#include "bt_acquire/AcquireResult.hpp"

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
const char* to_string(AcquireResult result) {
    switch (result) {
        case SUCCESS:
            return "success";
        case INVALID_ADDRESS:
            return "invalid device address";
        case INVALID_PATTERN:
            return "invalid device name pattern";
        case MISSING_CRITERION:
            return "neither a device address nor a device name pattern given";
        case DISCOVERY_START_FAILED:
            return "failed to start the device discovery";
        case DEVICE_NOT_FOUND:
            return "device not found";
        case CACHE_LIST_FAILED:
            return "failed to list the cached devices";
        case ADAPTER_UNAVAILABLE:
            return "no Bluetooth adapter available";
        case ADAPTER_POWER_FAILED:
            return "failed to power on the Bluetooth adapter";
        case NOT_INITIALIZED:
            return "not initialized";
        case ALREADY_STARTED:
            return "a search is already running";
        case SEARCH_STOPPED:
            return "the search got stopped";
    }
    return "unknown";
}
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
