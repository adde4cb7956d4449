#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias for pipeline error handling.

#include "cdp/core/result.hpp"
#include "cdp/foundation/game_error.hpp"

namespace cdp::foundation {

/// Result type specialized with GameError.
///
/// Registration, configuration and setup calls return GameResult<T>
/// instead of throwing.
///
/// Example:
/// @code
///   auto registered = registry.Register(id, record);
///   if (!registered) {
///       // registered.error().code() == ErrorCode::DuplicateEntity
///   }
/// @endcode
template <typename T>
using GameResult = cdp::Result<T, GameError>;

}  // namespace cdp::foundation
