#include "runner/native_runner.hpp"
#include <glog/logging.h>
#include "sandbox/sandbox.hpp"

namespace engine {
using namespace std;

/**
 * @brief 编译失败时的错误信息
 * 编译器的标准错误流非空时原样返回，否则返回编译器的退出原因
 */
static string compiler_error_log(const process_outcome &outcome) {
    return get<execution_error>(classify(outcome)).message;
}

native_runner::native_runner(const string &compiler, const string &source_code, chrono::milliseconds time_limit)
    : source_runner(source_code, time_limit), compiler(compiler) {}

string native_runner::compile(const filesystem::path &source_path, const filesystem::path &artifact_path) {
    process_outcome outcome = run_process({compiler, source_path.string(), "-o", artifact_path.string()}, "", nullopt);
    if (!outcome.success())
        throw compilation_error("compilation error", compiler_error_log(outcome));

    LOG(INFO) << "Compiled " << source_path << " with " << compiler;
    if (!outcome.stderr_text.empty()) return outcome.stderr_text;  // 编译警告
    return "Compilation successful";
}

execution_result native_runner::execute(const filesystem::path &artifact_path, const string &stdin_text) {
    return run({filesystem::absolute(artifact_path).string()}, stdin_text, time_limit);
}

}  // namespace engine
