#ifndef SIGNAL_ANALYSIS_LOGS_HPP
#define SIGNAL_ANALYSIS_LOGS_HPP

#include "trader/strategy_analysis/signal_generator.hpp"
#include <string>

namespace ConfluenceScalper {
namespace Logging {

class SignalAnalysisLogs {
public:
    static void log_signal_accepted(const Core::Signal& signal);
};

} // namespace Logging
} // namespace ConfluenceScalper

#endif // SIGNAL_ANALYSIS_LOGS_HPP
