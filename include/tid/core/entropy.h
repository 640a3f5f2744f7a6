// =============================================================================
// tid - Entropy Source
// =============================================================================
// Uniform random bits drawn from the operating system CSPRNG (getrandom(2)).
// Every call reads fresh bytes from the kernel, so no generator state is
// shared between threads.
// =============================================================================

#ifndef TID_CORE_ENTROPY_H
#define TID_CORE_ENTROPY_H

#include <cstdint>

#include "tid/common/error.h"

namespace tid {

/// @brief Draw a uniform value in [0, 2^width - 1].
/// @param width Number of random bits, 1..64.
/// @return Error kCryptoError when the kernel source fails,
///         kInvalidArgument when width is out of range.
[[nodiscard]] Result<std::uint64_t> randomBits(unsigned width);

}  // namespace tid

#endif  // TID_CORE_ENTROPY_H
