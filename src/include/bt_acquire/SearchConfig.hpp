#pragma once

#include <chrono>
#include <optional>
#include <string>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
/**
 * What to search for and how fast to retry connecting.
 * Either targetAddress or targetNamePattern has to be set.
 * In case both are set, targetAddress wins.
 **/
struct SearchConfig {
    /**
     * E.g. "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff" or "aabb.ccdd.eeff".
     **/
    std::optional<std::string> targetAddress{std::nullopt};
    /**
     * ECMAScript regular expression searched for in the device name.
     * A leading "(?i)" makes it case insensitive.
     **/
    std::optional<std::string> targetNamePattern{std::nullopt};
    std::chrono::milliseconds retryCooldown{std::chrono::seconds{2}};
} __attribute__((aligned(128)));
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
