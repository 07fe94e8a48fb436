#pragma once
#include <string>

#ifndef TETHER_DEFAULT_TIER
#define TETHER_DEFAULT_TIER 8
#endif

namespace tether {

/**
 * Capability tiers are versioned subsets of the engine operations. Higher tiers include
 * everything below them.
 */
using Tier = int;

constexpr Tier kTierBase = 1;       // values, calls, properties, exceptions
constexpr Tier kTierPromise = 3;    // promise / deferred pairs
constexpr Tier kTierThreadsafe = 4; // waking the event loop from another thread
constexpr Tier kTierBigInt = 6;     // arbitrary-precision integers
constexpr Tier kTierMax = 9;

// Throws `UnsupportedCapabilityError` if `active` is lower than `required`
void RequireTier(Tier active, Tier required, const std::string& feature);

} // namespace tether
