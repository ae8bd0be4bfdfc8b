#include "runner/runner.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace engine {
using namespace std;

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

runner::~runner() = default;

source_runner::source_runner(const string &source_code, chrono::milliseconds time_limit)
    : source_code(source_code), time_limit(time_limit) {}

void source_runner::initialize(const filesystem::path &source_path) {
    write_file_content(source_path, source_code);
    DLOG(INFO) << "Source code written to " << source_path;
}

void source_runner::cleanup(const filesystem::path &source_path, const filesystem::path &artifact_path) {
    remove_if_exists(source_path);
    remove_if_exists(artifact_path);
}

}  // namespace engine
