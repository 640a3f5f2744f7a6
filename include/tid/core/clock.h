// =============================================================================
// tid - Wall Clock
// =============================================================================

#ifndef TID_CORE_CLOCK_H
#define TID_CORE_CLOCK_H

#include "tid/common/types.h"

namespace tid {

/// @brief Current Unix time in whole seconds (system clock).
[[nodiscard]] UnixSeconds unixNow() noexcept;

}  // namespace tid

#endif  // TID_CORE_CLOCK_H
