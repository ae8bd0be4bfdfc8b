#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"

namespace engine {
using namespace std;

execution_result run(const vector<string> &command, const string &stdin_text, chrono::milliseconds time_limit) {
    elapsed_time timer;
    process_outcome outcome = run_process(command, stdin_text, time_limit);
    DLOG(INFO) << "Process " << command[0] << " finished in " << timer.duration<chrono::milliseconds>().count()
               << "ms, exit code: " << outcome.exit_code << ", signal: " << outcome.signal;
    return classify(outcome);
}

}  // namespace engine
