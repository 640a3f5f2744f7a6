// =============================================================================
// tid - Command Failure Reporting Implementation
// =============================================================================

#include "failure_report.h"

#include "tid/common/logger.h"

namespace tid::commands {

int reportFailure(std::string_view command, const TidException& e, std::ostream& err) {
    TID_LOG_DEBUG("{} failed: {}", command, e.what());
    err << "tidtool " << command << ": " << e.what() << std::endl;
    return e.exitCode();
}

int reportFailure(std::string_view command, const std::exception& e, std::ostream& err) {
    TID_LOG_ERROR("{} failed unexpectedly: {}", command, e.what());
    err << "tidtool " << command << ": unexpected error: " << e.what() << std::endl;
    return toExitCode(ErrorCode::kInternalError);
}

}  // namespace tid::commands
