#include "signal_analysis_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"

namespace ConfluenceScalper {
namespace Logging {

void SignalAnalysisLogs::log_signal_accepted(const Core::Signal& signal) {
    LOG_THREAD_CONTENT("SIGNAL " + TimeUtils::format_iso_utc(signal.timestamp) + " " + Core::format_signal(signal));
}

} // namespace Logging
} // namespace ConfluenceScalper
