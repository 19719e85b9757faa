#pragma once
#include <cstdint>
#include <random>
#include <skysync/geo.hpp>
#include <skysync/snapshot.hpp>

namespace skysync {

// Seed derived from the rounded bbox so the same region always yields the same traffic.
std::uint32_t fallback_seed(const BBox& b);

// Synthesize `count` airborne aircraft strictly inside `b`, observed at `now`.
// Deterministic with caller-provided rng. Result carries fallback = true,
// source = "synthetic" and a message for the user.
SnapshotSet synthesize_fallback(const BBox& b, int count, double now, std::mt19937& rng);

// Convenience: seeded from fallback_seed(b).
SnapshotSet synthesize_fallback(const BBox& b, int count, double now);

} // namespace skysync
