// =============================================================================
// tid - Entropy Source Implementation
// =============================================================================

#include "tid/core/entropy.h"

#include <array>
#include <cerrno>
#include <cstring>

#include <sys/random.h>

#include <fmt/format.h>

#include "tid/common/logger.h"

namespace tid {

Result<std::uint64_t> randomBits(unsigned width) {
    if (width == 0 || width > 64) {
        return makeError<std::uint64_t>(ErrorCode::kInvalidArgument,
                                        fmt::format("Invalid entropy width: {}", width));
    }

    std::array<std::uint8_t, 8> bytes{};
    std::size_t filled = 0;
    while (filled < bytes.size()) {
        const ssize_t n = getrandom(bytes.data() + filled, bytes.size() - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            TID_LOG_ERROR("getrandom failed: {}", std::strerror(err));
            return makeError<std::uint64_t>(
                ErrorCode::kCryptoError, fmt::format("getrandom failed: {}", std::strerror(err)));
        }
        filled += static_cast<std::size_t>(n);
    }

    std::uint64_t sample = 0;
    for (const std::uint8_t byte : bytes) {
        sample = (sample << 8) | byte;
    }

    if (width == 64) {
        return sample;
    }
    return sample & ((std::uint64_t{1} << width) - 1);
}

}  // namespace tid
