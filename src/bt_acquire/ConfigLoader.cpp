#include "bt_acquire/ConfigLoader.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
void load_target(const tinyxml2::XMLElement* target, SearchConfig* search) {
    const char* addr = target->Attribute("Address");
    if (addr && addr[0] != '\0') {
        search->targetAddress = addr;
    }
    const char* name = target->Attribute("Name");
    if (name && name[0] != '\0') {
        search->targetNamePattern = name;
    }
    int64_t cooldownMs = target->Int64Attribute("CooldownMs", search->retryCooldown.count());
    if (cooldownMs < 0) {
        SPDLOG_WARN("Ignoring negative cooldown of {} ms.", cooldownMs);
        return;
    }
    search->retryCooldown = std::chrono::milliseconds{cooldownMs};
}

void load_adapter(const tinyxml2::XMLElement* adapter, AcquireConfig* config) {
    const char* name = adapter->Attribute("Name");
    if (name) {
        config->adapterName = name;
    }
    const char* cacheDir = adapter->Attribute("CacheDir");
    if (cacheDir) {
        config->cacheDir = cacheDir;
    }
    config->discoveryTimeoutSeconds = adapter->UnsignedAttribute("DiscoveryTimeout", static_cast<unsigned>(config->discoveryTimeoutSeconds));
}

bool load_acquire_config(const std::filesystem::path& path, AcquireConfig* config) {
    SPDLOG_INFO("Loading config from '{}'...", path.string());
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError result = doc.LoadFile(path.c_str());
    if (result != tinyxml2::XML_SUCCESS) {
        SPDLOG_ERROR("Failed to load config '{}' with: {}", path.string(), tinyxml2::XMLDocument::ErrorIDToName(result));
        return false;
    }
    const tinyxml2::XMLElement* acquire = doc.FirstChildElement("ACQUIRE");
    if (!acquire) {
        SPDLOG_ERROR("Config '{}' is missing the 'ACQUIRE' element.", path.string());
        return false;
    }

    const tinyxml2::XMLElement* target = acquire->FirstChildElement("TARGET");
    if (target) {
        load_target(target, &config->search);
    }

    const tinyxml2::XMLElement* adapter = acquire->FirstChildElement("ADAPTER");
    if (adapter) {
        load_adapter(adapter, config);
    }

    const tinyxml2::XMLElement* log = acquire->FirstChildElement("LOG");
    if (log) {
        const char* level = log->Attribute("Level");
        if (level) {
            config->logLevel = logger::parse_level(level);
        }
    }
    SPDLOG_INFO("Config loaded.");
    return true;
}
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
