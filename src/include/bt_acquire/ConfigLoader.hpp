#pragma once

#include "bt_acquire/SearchConfig.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/common.h>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
struct AcquireConfig {
    SearchConfig search{};
    /**
     * E.g. "hci0". Empty selects the default adapter.
     **/
    std::string adapterName{};
    /**
     * Where BlueZ stores the devices it knows.
     **/
    std::filesystem::path cacheDir{"/var/lib/bluetooth"};
    /**
     * 0 discovers until the device got found.
     **/
    size_t discoveryTimeoutSeconds{0};
    spdlog::level::level_enum logLevel{spdlog::level::info};
} __attribute__((aligned(128)));

/**
 * Loads an XML config file of the form:
 * <ACQUIRE>
 *   <TARGET Address="AA:BB:CC:DD:EE:FF" Name="(?i)k850$" CooldownMs="2000"/>
 *   <ADAPTER Name="hci0" CacheDir="/var/lib/bluetooth" DiscoveryTimeout="0"/>
 *   <LOG Level="debug"/>
 * </ACQUIRE>
 * Missing elements and attributes keep their default value.
 * Returns false in case the file could not be parsed.
 **/
bool load_acquire_config(const std::filesystem::path& path, AcquireConfig* config);
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
