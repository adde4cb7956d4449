#pragma once

/// @file payload_reset.hpp
/// @brief Field reset for pooled pipeline payloads.
///
/// Clears every transient field so a released record carries nothing
/// into its next use.  Never frees memory.

#include "cdp/combat/damage_types.hpp"

namespace cdp::pipeline {

void ResetPayload(combat::DamageRequest& request) noexcept;

void ResetPayload(combat::DamageTagList& tags) noexcept;

}  // namespace cdp::pipeline
