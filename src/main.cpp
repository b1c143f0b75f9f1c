#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "container/docker.hpp"
#include "engine/engine.hpp"
#include "server.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("code-executor options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "execute the request in given json file, or read it from stdin if - is given, and print the result")
        ("serve", "read newline-delimited requests from stdin and print newline-delimited results in input order")
        ("concurrency", po::value<size_t>()->default_value(4), "set the maximum number of requests handled at the same time in serve mode")
        ("health", "check whether the docker daemon is reachable")
        ("docker-host", po::value<string>(), "set the unix socket of docker daemon, default to /var/run/docker.sock. You can either pass it from environ DOCKER_HOST")
        ("docker-api-version", po::value<string>(), "set the docker engine api version, default to v1.41")
        ("workspace-dir", po::value<string>(), "set the directory to store submitted files. You can either pass it from environ WORKSPACEDIR")
        ("memory-limit", po::value<int>(), "set memory limit in MiB of containers, default to 512")
        ("cpu-period", po::value<int>(), "set cpu period in microseconds of containers, default to 100000")
        ("cpu-quota", po::value<int>(), "set cpu quota in microseconds of containers, default to 50000")
        ("workers", po::value<int>(), "set the number of threads calling docker daemon, default to 4. You can either pass it from environ EXECUTORWORKERS")
        ("default-timeout", po::value<int>(), "set the timeout in seconds of requests without timeout, default to 30")
        ("pull-images", "pull the image of a language if docker daemon does not have it")
        ("provision", "run the provisioning command of a language before compiling in test suite mode")
        ("debug", "turn on the debug mode to log every state transition and docker call.")
        ("help", "display this help text")
        ("version", "display version of this application");
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
        cout << "CodeExecutor: Run submitted programs in docker containers, judge them against test cases" << endl
             << "This app requires access to the docker daemon socket" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-executor 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        executor::DEBUG = true;
    } else if (getenv("DEBUG")) {
        executor::DEBUG = true;
    }
    if (executor::DEBUG) {
        FLAGS_logtostderr = true;
        FLAGS_v = 1;
    }

    if (vm.count("docker-host")) {
        executor::DOCKER_HOST = vm.at("docker-host").as<string>();
    } else if (getenv("DOCKER_HOST")) {
        executor::DOCKER_HOST = getenv("DOCKER_HOST");
    }

    if (vm.count("docker-api-version")) {
        executor::DOCKER_API_VERSION = vm.at("docker-api-version").as<string>();
    }

    if (vm.count("workspace-dir")) {
        executor::WORKSPACE_DIR = filesystem::path(vm.at("workspace-dir").as<string>());
    } else if (getenv("WORKSPACEDIR")) {
        executor::WORKSPACE_DIR = filesystem::path(getenv("WORKSPACEDIR"));
    }
    filesystem::create_directories(executor::WORKSPACE_DIR);
    CHECK(filesystem::is_directory(executor::WORKSPACE_DIR))
        << "Workspace directory " << executor::WORKSPACE_DIR << " does not exist";

    if (vm.count("memory-limit")) {
        executor::MEMORY_LIMIT = vm["memory-limit"].as<int>();
    }
    CHECK(executor::MEMORY_LIMIT > 0) << "Memory limit should be positive";

    if (vm.count("cpu-period")) {
        executor::CPU_PERIOD = vm["cpu-period"].as<int>();
    }
    if (vm.count("cpu-quota")) {
        executor::CPU_QUOTA = vm["cpu-quota"].as<int>();
    }
    CHECK(executor::CPU_PERIOD > 0 && executor::CPU_QUOTA > 0) << "CPU period and quota should be positive";

    if (vm.count("workers")) {
        executor::WORKER_THREADS = vm["workers"].as<int>();
    } else if (getenv("EXECUTORWORKERS")) {
        executor::WORKER_THREADS = boost::lexical_cast<int>(getenv("EXECUTORWORKERS"));
    }
    CHECK(executor::WORKER_THREADS > 0) << "Number of workers should be positive";

    if (vm.count("default-timeout")) {
        executor::DEFAULT_TIMEOUT = vm["default-timeout"].as<int>();
    }
    CHECK(executor::DEFAULT_TIMEOUT > 0) << "Default timeout should be positive";

    if (vm.count("pull-images")) {
        executor::PULL_IMAGES = true;
    }

    if (vm.count("provision")) {
        executor::PROVISION_TOOLCHAINS = true;
    }

    executor::engine_options options;
    options.workspace_root = executor::WORKSPACE_DIR;
    options.limits.memory_bytes = (int64_t)executor::MEMORY_LIMIT << 20;
    options.limits.cpu_period = executor::CPU_PERIOD;
    options.limits.cpu_quota = executor::CPU_QUOTA;
    options.workers = executor::WORKER_THREADS;
    options.provision = executor::PROVISION_TOOLCHAINS;

    auto runtime = make_unique<executor::docker_runtime>(executor::DOCKER_HOST, executor::DOCKER_API_VERSION, executor::PULL_IMAGES);
    executor::execution_engine engine(move(runtime), options);

    if (vm.count("health")) {
        bool healthy = engine.healthy();
        cout << (healthy ? "docker daemon is reachable at " : "docker daemon is unreachable at ") << executor::DOCKER_HOST << endl;
        return healthy ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("serve")) {
        size_t concurrency = vm["concurrency"].as<size_t>();
        CHECK(concurrency > 0) << "Concurrency should be positive";
        LOG(INFO) << "Serving requests from stdin, concurrency " << concurrency << ", workers " << executor::WORKER_THREADS;
        executor::serve(engine, cin, cout, concurrency);
        return EXIT_SUCCESS;
    }

    if (vm.count("request")) {
        string path = vm["request"].as<string>();
        string text;
        if (path == "-") {
            text.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        } else {
            CHECK(filesystem::is_regular_file(path)) << "Request file " << path << " does not exist";
            text = executor::read_file_content(path);
        }
        bool ok;
        cout << executor::handle_request(engine, text, ok) << endl;
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    cerr << desc << endl;
    return EXIT_FAILURE;
}
