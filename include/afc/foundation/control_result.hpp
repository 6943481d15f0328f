#pragma once

/// @file control_result.hpp
/// @brief ControlResult<T> alias for controller operations.

#include "afc/core/result.hpp"
#include "afc/foundation/control_error.hpp"

namespace afc::foundation {

/// Result type specialized with ControlError.
///
/// Example:
/// @code
///   ControlResult<RegionRecord> r = store.transition(
///       service, region, RegionState::Healthy, RegionState::Degraded);
///   if (r.hasError() && r.error().code() == ErrorCode::ConflictError) {
///       // re-read and retry once, then defer to the next tick
///   }
/// @endcode
template <typename T>
using ControlResult = afc::Result<T, ControlError>;

}  // namespace afc::foundation
