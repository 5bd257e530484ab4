// TIERSTAKE - Engine Options
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#ifndef TIERSTAKE_STAKING_OPTIONS_H
#define TIERSTAKE_STAKING_OPTIONS_H

#include <tierstake/core/types.h>
#include <tierstake/staking/cooldown.h>
#include <tierstake/util/config.h>

namespace tierstake {
namespace staking {

struct EngineOptions {
    /// Minimum interval between deposits by one principal
    Duration cooldownPeriod{DEFAULT_COOLDOWN_PERIOD};

    /// Account that holds staked funds (null address by default)
    Address custody;
};

/**
 * Read engine options from configuration.
 *
 * Keys: cooldown (seconds, or suffixed s/m/h/d), custody (40 hex chars).
 * Missing keys keep the defaults in `options`.
 */
util::ConfigParseResult LoadEngineOptions(const util::ConfigManager& config,
                                          EngineOptions& options);

/// Read the owner address. Errors if missing or malformed.
util::ConfigParseResult LoadOwner(const util::ConfigManager& config, Address& owner);

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_OPTIONS_H
