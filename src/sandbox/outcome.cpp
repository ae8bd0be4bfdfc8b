#include "sandbox/outcome.hpp"
#include <fmt/core.h>
#include <signal.h>
#include <boost/assign.hpp>
#include <map>
#include "common/io_utils.hpp"

namespace engine {
using namespace std;

const char *const TIMEOUT_MESSAGE = "Process timed out and killed";

static const map<int, const char *> fault_signals = boost::assign::map_list_of
    (SIGSEGV, "SIGSEGV")
    (SIGFPE, "SIGFPE")
    (SIGILL, "SIGILL")
    (SIGABRT, "SIGABRT")
    (SIGBUS, "SIGBUS");

string signal_name(int sig) {
    auto it = fault_signals.find(sig);
    if (it == fault_signals.end()) return "Unknown Signal";
    return it->second;
}

execution_result classify(const process_outcome &outcome) {
    if (outcome.timed_out)
        return execution_error{TIMEOUT_MESSAGE};

    if (outcome.success() && utf8_check_is_valid(outcome.stdout_text))
        return execution_output{outcome.stdout_text};

    if (!outcome.stderr_text.empty())
        return execution_error{outcome.stderr_text};

    if (outcome.signal != 0)
        return execution_error{fmt::format("Program terminated with signal: {}", signal_name(outcome.signal))};

    return execution_error{fmt::format("Program terminated with code: {}", outcome.exit_code)};
}

bool is_success(const execution_result &result) {
    return std::holds_alternative<execution_output>(result);
}

}  // namespace engine
