#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "monitor/statistics.hpp"
#include "process/subprocess.hpp"
#include "server/service.hpp"
#include "worker.hpp"
using namespace std;

sandbox::concurrent_queue<sandbox::request_task> request_queue;

void sigintHandler(int /* signum */) {
    sandbox::stop_workers();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    // 不设置 SA_RESTART，使阻塞在读取 stdin 上的 getline 被中断
    struct sigaction action = {};
    action.sa_handler = sigintHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sandbox::process::ignore_sigpipe();

    namespace po = boost::program_options;
    po::options_description desc("sandbox-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("input", po::value<string>(), "read newline-delimited JSON requests from this file instead of stdin")
        ("workers", po::value<unsigned>(), "set the number of requests processed concurrently, default to 4. You can either pass it from environ SANDBOX_WORKERS")
        ("workspace-dir", po::value<string>(), "set the directory to create request workspaces in. You can either pass it from environ SANDBOX_WORKSPACE_DIR")
        ("script-dir", po::value<string>(), "set the directory with helper scripts stored. You can either pass it from environ SANDBOX_SCRIPT_DIR")
        ("language-config", po::value<string>(), "set the language and kernel configuration file. You can either pass it from environ SANDBOX_LANGUAGE_CONFIG")
        ("stats-log-every", po::value<uint64_t>(), "log statistics every N requests, 0 to disable, default to 200. You can either pass it from environ SANDBOX_STATS_LOG_EVERY")
        ("stats-log-seconds", po::value<double>(), "log statistics every N seconds, 0 to disable, default to 0. You can either pass it from environ SANDBOX_STATS_LOG_SECONDS")
        ("import-error-pattern", po::value<string>(), "set the regex matching module-not-found errors in stderr. You can either pass it from environ SANDBOX_IMPORT_ERROR_PATTERN")
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
        cout << "Sandbox runner: compile and run untrusted code snippets" << endl
             << "Reads one JSON request per line, writes one JSON response per line" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        if (vm.count("workers")) {
            sandbox::WORKER_COUNT = vm.at("workers").as<unsigned>();
        } else {
            sandbox::WORKER_COUNT = sandbox::get_env_as<unsigned>("SANDBOX_WORKERS", sandbox::WORKER_COUNT);
        }

        if (vm.count("stats-log-every")) {
            sandbox::STATS_LOG_EVERY = vm.at("stats-log-every").as<uint64_t>();
        } else {
            sandbox::STATS_LOG_EVERY = sandbox::get_env_as<uint64_t>("SANDBOX_STATS_LOG_EVERY", sandbox::STATS_LOG_EVERY);
        }

        if (vm.count("stats-log-seconds")) {
            sandbox::STATS_LOG_SECONDS = vm.at("stats-log-seconds").as<double>();
        } else {
            sandbox::STATS_LOG_SECONDS = sandbox::get_env_as<double>("SANDBOX_STATS_LOG_SECONDS", sandbox::STATS_LOG_SECONDS);
        }
    } catch (boost::bad_lexical_cast& e) {
        LOG(FATAL) << "Malformed numeric environment variable: " << e.what();
    }
    CHECK(sandbox::WORKER_COUNT > 0) << "At least one worker is required";

    if (vm.count("workspace-dir")) {
        sandbox::WORKSPACE_DIR = filesystem::path(vm.at("workspace-dir").as<string>());
    } else {
        sandbox::WORKSPACE_DIR = sandbox::get_env("SANDBOX_WORKSPACE_DIR", (filesystem::temp_directory_path() / "sandbox").string());
    }
    filesystem::create_directories(sandbox::WORKSPACE_DIR);
    CHECK(filesystem::is_directory(sandbox::WORKSPACE_DIR))
        << "Workspace directory " << sandbox::WORKSPACE_DIR << " does not exist";

    if (vm.count("script-dir")) {
        sandbox::SCRIPT_DIR = filesystem::path(vm.at("script-dir").as<string>());
    } else if (getenv("SANDBOX_SCRIPT_DIR")) {
        sandbox::SCRIPT_DIR = filesystem::path(getenv("SANDBOX_SCRIPT_DIR"));
    } else {
        filesystem::path scriptdir(repo_dir / "script");
        if (filesystem::exists(scriptdir)) {
            sandbox::SCRIPT_DIR = scriptdir;
        }
    }
    sandbox::SCRIPT_DIR = filesystem::weakly_canonical(sandbox::SCRIPT_DIR);

    if (vm.count("language-config")) {
        sandbox::LANGUAGE_CONFIG = filesystem::path(vm.at("language-config").as<string>());
    } else if (getenv("SANDBOX_LANGUAGE_CONFIG")) {
        sandbox::LANGUAGE_CONFIG = filesystem::path(getenv("SANDBOX_LANGUAGE_CONFIG"));
    } else {
        sandbox::LANGUAGE_CONFIG = repo_dir / "etc" / "languages.json";
    }
    CHECK(filesystem::is_regular_file(sandbox::LANGUAGE_CONFIG))
        << "Language configuration file " << sandbox::LANGUAGE_CONFIG << " does not exist";

    if (vm.count("import-error-pattern")) {
        sandbox::IMPORT_ERROR_PATTERN = vm.at("import-error-pattern").as<string>();
    } else {
        sandbox::IMPORT_ERROR_PATTERN = sandbox::get_env("SANDBOX_IMPORT_ERROR_PATTERN", sandbox::IMPORT_ERROR_PATTERN);
    }

    sandbox::POD_NAME = sandbox::get_env("MY_POD_NAME", "");

    // 让沙盒写入的数据只允许当前用户写入
    umask(0022);

    sandbox::language_config config;
    try {
        config = sandbox::language_config::load(sandbox::LANGUAGE_CONFIG);
    } catch (std::exception& e) {
        LOG(FATAL) << "Configuration file " << sandbox::LANGUAGE_CONFIG << " is malformed: " << e.what();
    }

    unique_ptr<sandbox::import_error_matcher> matcher;
    try {
        matcher = make_unique<sandbox::import_error_matcher>(sandbox::IMPORT_ERROR_PATTERN);
    } catch (boost::regex_error& e) {
        LOG(FATAL) << "Import error pattern " << sandbox::IMPORT_ERROR_PATTERN << " is malformed: " << e.what();
    }

    sandbox::recipe_environment env;
    env.workspace_root = sandbox::WORKSPACE_DIR;
    env.script_dir = sandbox::SCRIPT_DIR;

    sandbox::glog_monitor monitor;
    sandbox::run_statistics stats(monitor, sandbox::STATS_LOG_EVERY, chrono::duration<double>(sandbox::STATS_LOG_SECONDS));
    sandbox::statistics_reporter reporter(stats);
    sandbox::sandbox_service service(config, env, *matcher, stats, monitor,
                                     sandbox::POD_NAME.empty() ? nullopt : optional<string>(sandbox::POD_NAME));

    for (auto lang : sandbox::all_languages())
        if (!service.registry().contains(lang))
            LOG(WARNING) << "Language " << sandbox::get_language_name(lang) << " is not configured";

    if (reporter.start())
        LOG(INFO) << "Reporting statistics every " << sandbox::STATS_LOG_SECONDS << " seconds";

    sandbox::response_writer writer(cout);
    vector<thread> worker_threads;
    for (unsigned i = 0; i < sandbox::WORKER_COUNT; ++i)
        worker_threads.push_back(sandbox::start_worker(i, service, request_queue, writer));

    size_t count;
    if (vm.count("input")) {
        ifstream fin(vm.at("input").as<string>());
        CHECK(fin) << "Unable to open input file " << vm.at("input").as<string>();
        count = sandbox::read_requests(fin, request_queue);
    } else {
        count = sandbox::read_requests(cin, request_queue);
    }
    LOG(INFO) << "Read " << count << " requests" << (sandbox::workers_stopped() ? ", interrupted" : "");

    for (auto& th : worker_threads)
        th.join();

    reporter.stop();
    stats.flush(true);
    return 0;
}
