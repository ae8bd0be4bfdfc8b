#include "runner/script_runner.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "sandbox/sandbox.hpp"

namespace engine {
using namespace std;

script_runner::script_runner(const string &interpreter, const vector<string> &syntax_check,
                             const string &source_code, chrono::milliseconds time_limit)
    : source_runner(source_code, time_limit), interpreter(interpreter), syntax_check(syntax_check) {}

string script_runner::compile(const filesystem::path &source_path, const filesystem::path &artifact_path) {
    vector<string> command = {interpreter};
    command.insert(command.end(), syntax_check.begin(), syntax_check.end());
    command.push_back(source_path.string());

    process_outcome outcome = run_process(command, "", nullopt);
    if (!outcome.success())
        throw compilation_error("syntax error", get<execution_error>(classify(outcome)).message);

    error_code ec;
    filesystem::copy_file(source_path, artifact_path, filesystem::copy_options::overwrite_existing, ec);
    if (ec) throw io_error("Unable to copy script to " + artifact_path.string() + ": " + ec.message());

    LOG(INFO) << "Syntax of " << source_path << " checked by " << interpreter;
    return "Syntax check passed";
}

execution_result script_runner::execute(const filesystem::path &artifact_path, const string &stdin_text) {
    return run({interpreter, artifact_path.string()}, stdin_text, time_limit);
}

}  // namespace engine
