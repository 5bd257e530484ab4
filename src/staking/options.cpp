// TIERSTAKE - Engine Options Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/options.h"
#include "tierstake/util/time.h"

#include <stdexcept>

namespace tierstake {
namespace staking {

namespace {

util::ConfigParseResult ParseAddress(const std::string& key, const std::string& value,
                                     Address& out) {
    try {
        out = Address::FromHex(value);
    } catch (const std::invalid_argument& e) {
        return util::ConfigParseResult::Error(
            "Invalid address for '" + key + "': " + e.what());
    }
    return util::ConfigParseResult::Success();
}

} // namespace

util::ConfigParseResult LoadEngineOptions(const util::ConfigManager& config,
                                          EngineOptions& options) {
    if (auto value = config.TryGetString(util::ConfigKeys::COOLDOWN)) {
        auto seconds = util::ParseDuration(*value);
        if (!seconds) {
            return util::ConfigParseResult::Error("Invalid cooldown duration: " + *value);
        }
        options.cooldownPeriod = *seconds;
    }

    if (auto value = config.TryGetString(util::ConfigKeys::CUSTODY)) {
        auto result = ParseAddress(util::ConfigKeys::CUSTODY, *value, options.custody);
        if (!result.success) {
            return result;
        }
    }

    return util::ConfigParseResult::Success();
}

util::ConfigParseResult LoadOwner(const util::ConfigManager& config, Address& owner) {
    auto value = config.TryGetString(util::ConfigKeys::OWNER);
    if (!value) {
        return util::ConfigParseResult::Error("Missing required key: owner");
    }
    return ParseAddress(util::ConfigKeys::OWNER, *value, owner);
}

} // namespace staking
} // namespace tierstake
