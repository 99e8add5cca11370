#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "rse/core/result.hpp"
#include "rse/foundation/game_error.hpp"

namespace rse::foundation {

/// Result type specialized with GameError.
///
/// Every loader, validator and factory that can fail returns
/// GameResult<T> instead of throwing.
///
/// Example:
/// @code
///   GameResult<double> plantTime(double seconds) {
///       if (seconds <= 0.0) {
///           return GameResult<double>::err(
///               GameError(ErrorCode::ConfigValueOutOfRange, "plant time must be positive"));
///       }
///       return GameResult<double>::ok(seconds);
///   }
/// @endcode
template <typename T>
using GameResult = rse::Result<T, GameError>;

}  // namespace rse::foundation
