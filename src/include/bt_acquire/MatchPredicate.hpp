#pragma once

#include "bt_acquire/AcquireResult.hpp"
#include "bt_acquire/SearchConfig.hpp"
#include <functional>
#include <string>

//---------------------------------------------------------------------------
namespace bt_acquire {
//---------------------------------------------------------------------------
/**
 * Returns true in case the device with the given address and name is the one we are looking for.
 **/
using MatchPredicate = std::function<bool(const std::string& addr, const std::string& name)>;

/**
 * Builds the predicate for the given config.
 * An address gets normalized first and has to match exactly, the name gets ignored.
 * Otherwise the name pattern has to match somewhere inside the name, the address gets ignored.
 * predicate is only written on SUCCESS.
 * Returns INVALID_ADDRESS, INVALID_PATTERN or MISSING_CRITERION in case the config is invalid.
 **/
AcquireResult build_match_predicate(const SearchConfig& config, MatchPredicate* predicate);
//---------------------------------------------------------------------------
}  // namespace bt_acquire
//---------------------------------------------------------------------------
