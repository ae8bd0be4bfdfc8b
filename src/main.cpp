#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "server/config.hpp"
#include "server/queue_job_server.hpp"
#include "store/memory_task_store.hpp"
#include "store/redis_task_store.hpp"
#include "task/orchestrator.hpp"
#include "worker.hpp"
using namespace std;

void signalHandler(int signum) {
    LOG(ERROR) << "Received signal " << signum << ", stopping workers";
    engine::stop_workers();
}

static nlohmann::json read_json_file(const string& path) {
    try {
        return nlohmann::json::parse(engine::read_file_content(path));
    } catch (nlohmann::json::exception& ex) {
        throw engine::configuration_error("Malformed JSON file " + path + ": " + ex.what());
    }
}

static unique_ptr<engine::task_store> create_task_store(const engine::server::engine_config& config) {
    if (config.has_redis)
        return make_unique<engine::redis_task_store>(config.redis_config);
    LOG(WARNING) << "Redis is not configured, task status records are kept in memory";
    return make_unique<engine::memory_task_store>();
}

static int submit(const engine::server::engine_config& config, const string& request_path) {
    auto request = read_json_file(request_path).get<engine::submission_request>();
    engine::server::job_publisher publisher(config.queue);
    cout << nlohmann::json(publisher.submit(request)).dump(4) << endl;
    return EXIT_SUCCESS;
}

static int query_status(const engine::server::engine_config& config, const string& task_id) {
    if (!config.has_redis)
        throw engine::configuration_error("Querying task status requires redis configuration");
    engine::redis_task_store store(config.redis_config);
    auto record = store.find_by_id(task_id);
    if (!record) {
        cerr << "Task " << task_id << " not found" << endl;
        return EXIT_FAILURE;
    }
    cout << nlohmann::json(*record).dump(4) << endl;
    return EXIT_SUCCESS;
}

static int test_run(const string& request_path) {
    auto request = read_json_file(request_path).get<engine::test_run_request>();
    engine::memory_task_store store;
    engine::task_orchestrator orchestrator(store, engine::RUN_DIR, engine::EXECUTION_TIME_LIMIT);
    cout << nlohmann::json(orchestrator.test_run(request)).dump(4) << endl;
    return EXIT_SUCCESS;
}

static int serve(const engine::server::engine_config& config) {
    auto store = create_task_store(config);
    engine::task_orchestrator orchestrator(*store, engine::RUN_DIR, engine::EXECUTION_TIME_LIMIT);

    unique_ptr<engine::server::queue_job_server> server;
    try {
        server = make_unique<engine::server::queue_job_server>(config.queue, engine::prefetch_count(engine::WORKER_NUM));
    } catch (engine::network_error& ex) {
        LOG(FATAL) << "Unable to connect to RabbitMQ: " << ex.what();
    }

    // 评测队列的容量等于 worker 数量，所有 worker 都在评测时 consumer 阻塞
    engine::concurrent_queue<engine::message::job_delivery> job_queue(engine::WORKER_NUM);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    vector<thread> worker_threads;
    worker_threads.push_back(engine::start_consumer(*server, job_queue));
    for (size_t i = 0; i < engine::WORKER_NUM; ++i)
        worker_threads.push_back(engine::start_worker(i, *server, orchestrator, job_queue));

    for (auto& th : worker_threads)
        th.join();

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("code-engine options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("help", "display this help text")
        ("version", "display version of this application")
        ("config", po::value<string>(), "set the configuration file with RabbitMQ and Redis connections. You can either pass it from environ ENGINE_CONFIG")
        ("workers", po::value<size_t>(), "set the number of tasks judged concurrently, default to 4. You can either pass it from environ WORKERS")
        ("run-dir", po::value<string>(), "set the directory to store source code and compiled programs, default to /tmp/code-engine. You can either pass it from environ RUNDIR")
        ("time-limit", po::value<unsigned>(), "set the wall clock time limit in seconds of each test case, default to 5. You can either pass it from environ TIMELIMIT")
        ("submit", po::value<string>(), "publish the submission request in the given JSON file to the job queue and print the task id")
        ("status", po::value<string>(), "print the task status record with the given task id")
        ("test-run", po::value<string>(), "compile and run the test run request in the given JSON file without the job queue");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "code-engine: Fetch tasks from the job queue, compile and run them against test cases" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-engine 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("workers")) {
        engine::WORKER_NUM = vm.at("workers").as<size_t>();
    } else if (getenv("WORKERS")) {
        engine::WORKER_NUM = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }
    CHECK(engine::WORKER_NUM > 0 && engine::WORKER_NUM <= UINT16_MAX) << "Number of workers should be between 1 and 65535";

    if (vm.count("run-dir")) {
        engine::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        engine::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(engine::RUN_DIR);
    engine::RUN_DIR = filesystem::canonical(engine::RUN_DIR);
    CHECK(filesystem::is_directory(engine::RUN_DIR))
        << "Run directory " << engine::RUN_DIR << " does not exist";

    if (vm.count("time-limit")) {
        engine::EXECUTION_TIME_LIMIT = chrono::seconds(vm.at("time-limit").as<unsigned>());
    } else if (getenv("TIMELIMIT")) {
        engine::EXECUTION_TIME_LIMIT = chrono::seconds(boost::lexical_cast<unsigned>(getenv("TIMELIMIT")));
    }

    try {
        if (vm.count("test-run"))
            return test_run(vm.at("test-run").as<string>());

        string config_path = engine::get_env("ENGINE_CONFIG", "");
        if (vm.count("config"))
            config_path = vm.at("config").as<string>();
        CHECK(!config_path.empty()) << "Configuration file should be specified by --config or ENGINE_CONFIG";
        engine::server::engine_config config = engine::server::load_config(config_path);

        if (vm.count("submit"))
            return submit(config, vm.at("submit").as<string>());
        if (vm.count("status"))
            return query_status(config, vm.at("status").as<string>());
        return serve(config);
    } catch (engine::engine_exception& ex) {
        LOG(ERROR) << ex.what() << endl
                   << ex;
        return EXIT_FAILURE;
    } catch (std::exception& ex) {
        LOG(ERROR) << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
}
