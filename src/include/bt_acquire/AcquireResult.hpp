#pragma once

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
enum AcquireResult {
    SUCCESS,
    INVALID_ADDRESS,
    INVALID_PATTERN,
    MISSING_CRITERION,
    DISCOVERY_START_FAILED,
    /**
     * Only used internally to fall back from the cache to a discovery.
     **/
    DEVICE_NOT_FOUND,
    CACHE_LIST_FAILED,
    ADAPTER_UNAVAILABLE,
    ADAPTER_POWER_FAILED,
    NOT_INITIALIZED,
    ALREADY_STARTED,
    /**
     * stop() got called before the search got to connecting or discovering.
     **/
    SEARCH_STOPPED
};

[[nodiscard]] const char* to_string(AcquireResult result);
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
