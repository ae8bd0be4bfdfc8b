#include "config.hpp"
#include <limits>
#include "common/exceptions.hpp"

namespace engine {
using namespace std;

filesystem::path RUN_DIR = "/tmp/code-engine";
chrono::milliseconds EXECUTION_TIME_LIMIT = chrono::seconds(5);
size_t WORKER_NUM = 4;
unsigned CONNECT_MAX_RETRIES = 12;
chrono::milliseconds CONNECT_RETRY_INTERVAL = chrono::seconds(5);

uint16_t prefetch_count(size_t worker_num) {
    if (worker_num == 0 || worker_num > numeric_limits<uint16_t>::max())
        throw configuration_error("Number of workers should be between 1 and 65535, got " + to_string(worker_num));
    return (uint16_t)worker_num;
}

}  // namespace engine
