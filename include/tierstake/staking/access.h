// TIERSTAKE - Access Control
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Single immutable owner plus a whitelist of approved principals.

#ifndef TIERSTAKE_STAKING_ACCESS_H
#define TIERSTAKE_STAKING_ACCESS_H

#include <tierstake/core/types.h>
#include <tierstake/staking/errors.h>

#include <set>

namespace tierstake {
namespace staking {

/**
 * Flat owner/whitelist model. Guards return a StakeResult so the engine can
 * chain them. Not internally synchronised.
 */
class AccessControl {
public:
    explicit AccessControl(const Address& owner) : owner_(owner) {}

    const Address& GetOwner() const { return owner_; }

    /// NotOwner unless caller is the owner
    StakeResult RequireOwner(const Address& caller) const;

    /// NotApproved unless caller is whitelisted
    StakeResult RequireApproved(const Address& caller) const;

    /// Set whitelist status. Idempotent.
    void SetApproval(const Address& principal, bool approved);

    bool IsApproved(const Address& principal) const {
        return approved_.count(principal) > 0;
    }

    const std::set<Address>& GetApproved() const { return approved_; }

    void Restore(const std::set<Address>& approved) { approved_ = approved; }

private:
    Address owner_;
    std::set<Address> approved_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_ACCESS_H
