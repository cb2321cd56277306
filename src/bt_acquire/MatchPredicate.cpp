#include "bt_acquire/MatchPredicate.hpp"
#include "bt/BTAddress.hpp"
#include <regex>
#include <string>
#include <spdlog/spdlog.h>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
constexpr const char* CASE_INSENSITIVE_FLAG = "(?i)";

AcquireResult build_match_predicate(const SearchConfig& config, MatchPredicate* predicate) {
    if (config.targetAddress && !config.targetAddress->empty()) {
        std::string addr;
        if (!bt::normalize_address(*config.targetAddress, &addr)) {
            SPDLOG_ERROR("Invalid device address '{}'.", *config.targetAddress);
            return INVALID_ADDRESS;
        }
        SPDLOG_DEBUG("Searching for device address '{}'.", addr);
        *predicate = [addr](const std::string& devAddr, const std::string& /*name*/) { return devAddr == addr; };
        return SUCCESS;
    }

    if (!config.targetNamePattern || config.targetNamePattern->empty()) {
        SPDLOG_ERROR("Either a device address or a device name pattern has to be specified.");
        return MISSING_CRITERION;
    }

    std::string pattern = *config.targetNamePattern;
    std::regex::flag_type flags = std::regex::ECMAScript;
    if (pattern.rfind(CASE_INSENSITIVE_FLAG, 0) == 0) {
        pattern = pattern.substr(std::char_traits<char>::length(CASE_INSENSITIVE_FLAG));
        flags |= std::regex::icase;
    }

    std::regex nameRegex;
    try {
        nameRegex = std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        SPDLOG_ERROR("Failed to compile device name pattern '{}' with: {}", *config.targetNamePattern, e.what());
        return INVALID_PATTERN;
    }
    SPDLOG_DEBUG("Searching for device name pattern '{}'.", *config.targetNamePattern);
    *predicate = [nameRegex](const std::string& /*addr*/, const std::string& name) { return std::regex_search(name, nameRegex); };
    return SUCCESS;
}
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
