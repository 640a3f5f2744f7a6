// =============================================================================
// tid - Wall Clock Implementation
// =============================================================================

#include "tid/core/clock.h"

#include <chrono>

namespace tid {

UnixSeconds unixNow() noexcept {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

}  // namespace tid
