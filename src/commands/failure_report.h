// =============================================================================
// tid - Command Failure Reporting
// =============================================================================
// Turns an exception escaping a command into a stderr line and an exit code.
// =============================================================================

#ifndef TID_COMMANDS_FAILURE_REPORT_H
#define TID_COMMANDS_FAILURE_REPORT_H

#include <exception>
#include <iostream>
#include <string_view>

#include "tid/common/error.h"

namespace tid::commands {

/// @brief Report a TidException raised by a command.
/// @return The exception's exit code.
int reportFailure(std::string_view command, const TidException& e, std::ostream& err = std::cerr);

/// @brief Report a failure outside the tid error hierarchy.
/// @return Exit code of ErrorCode::kInternalError.
int reportFailure(std::string_view command, const std::exception& e, std::ostream& err = std::cerr);

}  // namespace tid::commands

#endif  // TID_COMMANDS_FAILURE_REPORT_H
