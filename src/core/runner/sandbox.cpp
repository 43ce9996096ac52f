#include "sandbox.h"

#include <sstream>

namespace runbox
{
    const char* TerminationName(Termination termination)
    {
        switch (termination)
        {
            case Termination::COMPLETED:       return "Completed";
            case Termination::TIMED_OUT:       return "TimedOut";
            case Termination::RESOURCE_KILLED: return "ResourceKilled";
            case Termination::LAUNCH_FAILED:   return "LaunchFailed";
        }
        return "Unknown";
    }

    const char* ClassificationName(const RunResult& result)
    {
        if (result.termination == Termination::COMPLETED && result.exit_code != 0) {
            return "RuntimeError";
        }
        return TerminationName(result.termination);
    }

    std::string TimeoutMessage(int timeout_ms)
    {
        std::ostringstream oss;
        oss << "Execution timed out after " << (timeout_ms / 1000.0) << " seconds.";
        return oss.str();
    }

    std::string OutOfMemoryMessage(long long memory_limit_bytes)
    {
        return "Process killed (likely out of memory > " +
               std::to_string(memory_limit_bytes / (1024 * 1024)) + "m).";
    }
}
