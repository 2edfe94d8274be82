#include <glog/logging.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/io_utils.hpp"
#include "common/messages.hpp"
#include "config.hpp"
#include "grader/language.hpp"
#include "grader/pipeline.hpp"
#include "grader/runner.hpp"
#include "server/http_server.hpp"
#include "server/messages.hpp"
#include "worker.hpp"
using namespace std;

namespace po = boost::program_options;
namespace asio = boost::asio;

bayview::concurrent_queue<bayview::message::judge_task> task_queue;

namespace bayview {

// program_options 通过 ADL 查找 validate，因此必须与 compare_mode 在同一个命名空间
void validate(boost::any& v, const vector<string>& values, compare_mode*, int) {
    po::validators::check_first_occurrence(v);
    string const& s = po::validators::get_single_string(values);
    if (s == "collapse")
        v = compare_mode::COLLAPSE;
    else if (s == "tokens")
        v = compare_mode::TOKENS;
    else
        throw po::validation_error(po::validation_error::invalid_option_value);
}

}  // namespace bayview

static asio::ip::tcp::endpoint parse_endpoint(const string& literal) {
    size_t colon = literal.rfind(':');
    if (colon == string::npos)
        throw invalid_argument("Listen address should be ADDR:PORT, got " + literal);
    string host = literal.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
    auto address = asio::ip::make_address(host.empty() ? "0.0.0.0" : host);
    auto port = boost::lexical_cast<unsigned short>(literal.substr(colon + 1));
    return {address, port};
}

template <typename T>
static bool get_option(const po::variables_map& vm, const string& option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
        return true;
    } else if (getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
        return true;
    }
    return false;
}

/**
 * @brief 启动 worker，评测完队列中的所有任务后返回
 */
static void judge_all(size_t workers, const bayview::grading_pipeline& pipeline) {
    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(bayview::start_worker(i, task_queue, pipeline));
    bayview::stop_workers();
    for (auto& th : worker_threads)
        th.join();
}

static int serve(const asio::ip::tcp::endpoint& endpoint, size_t workers, const bayview::grading_pipeline& pipeline) {
    asio::io_context ioc;
    auto server = make_shared<bayview::server::http_server>(ioc, endpoint, task_queue);

    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(bayview::start_worker(i, task_queue, pipeline));

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signum) {
        if (ec) return;
        LOG(WARNING) << "Received signal " << signum << ", shutting down";
        server->stop();
        bayview::stop_workers();
    });

    server->run();
    ioc.run();

    for (auto& th : worker_threads)
        th.join();
    LOG(INFO) << "Grader has stopped";
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("bayview-grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("listen", po::value<string>(), "serve POST /v1/judge-submission on ADDR:PORT, default to 0.0.0.0:3000. You can either pass it from environ LISTEN")
        ("request", po::value<vector<string>>()->multitoken(), "judge the JSON submission requests in given files, print one verdict per line")
        ("source", po::value<string>(), "judge the given source file")
        ("language", po::value<string>(), "language of the source file: c, c++, java, python")
        ("input", po::value<string>(), "file to feed into standard input of the program, default to empty input")
        ("expected", po::value<string>(), "file with expected output, default to empty output")
        ("time-limit", po::value<int>()->default_value(1), "time limit in seconds of the program")
        ("workers", po::value<size_t>(), "set the number of submissions judged simultaneously, default to the number of cores. You can either pass it from environ WORKERS")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs, default to <temp>/bayview. You can either pass it from environ RUNDIR")
        ("compile-time-limit", po::value<int>(), "set time limit in seconds for compilers, default to 0 (unlimited). You can either pass it from environ COMPILETIMELIMIT")
        ("output-limit", po::value<size_t>(), "set output limit in KB of user programs, default to 262144 (256MB), 0 for unlimited. You can either pass it from environ OUTPUTLIMIT")
        ("compare-mode", po::value<bayview::compare_mode>(), "collapse: remove all spaces and line breaks before comparing; tokens: compare whitespace separated tokens. You can either pass it from environ COMPAREMODE")
        ("cxx", po::value<string>(), "C++ compiler. You can either pass it from environ CXX")
        ("cc", po::value<string>(), "C compiler. You can either pass it from environ CC")
        ("javac", po::value<string>(), "Java compiler. You can either pass it from environ JAVAC")
        ("java", po::value<string>(), "Java virtual machine. You can either pass it from environ JAVA")
        ("python", po::value<string>(), "Python interpreter. You can either pass it from environ PYTHON")
        ("language-config", po::value<string>(), "JSON file overriding build and run commands of languages")
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
        cout << "BayviewGrader: compile, run and judge submissions" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "bayview-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    bayview::language_table languages;
    size_t workers = max(1u, thread::hardware_concurrency());
    asio::ip::tcp::endpoint endpoint(asio::ip::address_v4::any(), 3000);

    try {
        string listen;
        if (get_option(vm, "listen", "LISTEN", listen))
            endpoint = parse_endpoint(listen);

        get_option(vm, "workers", "WORKERS", workers);

        string run_dir;
        if (get_option(vm, "run-dir", "RUNDIR", run_dir))
            bayview::RUN_DIR = filesystem::path(run_dir);
        else
            bayview::RUN_DIR = filesystem::temp_directory_path() / "bayview";

        get_option(vm, "compile-time-limit", "COMPILETIMELIMIT", bayview::COMPILE_TIME_LIMIT);

        size_t output_limit;
        if (get_option(vm, "output-limit", "OUTPUTLIMIT", output_limit))
            bayview::OUTPUT_LIMIT = output_limit * 1024;

        if (vm.count("compare-mode")) {
            bayview::COMPARE_MODE = vm.at("compare-mode").as<bayview::compare_mode>();
        } else if (getenv("COMPAREMODE")) {
            string mode = getenv("COMPAREMODE");
            if (mode == "tokens")
                bayview::COMPARE_MODE = bayview::compare_mode::TOKENS;
            else if (mode != "collapse")
                throw invalid_argument("Unrecognized compare mode " + mode);
        }

        if (vm.count("language-config"))
            languages.load(filesystem::path(vm.at("language-config").as<string>()));

        string program;
        if (get_option(vm, "cxx", "CXX", program))
            languages.set_build_program(bayview::language::CPP, program);
        if (get_option(vm, "cc", "CC", program))
            languages.set_build_program(bayview::language::C, program);
        if (get_option(vm, "javac", "JAVAC", program))
            languages.set_build_program(bayview::language::JAVA, program);
        if (get_option(vm, "java", "JAVA", program))
            languages.set_run_program(bayview::language::JAVA, program);
        if (get_option(vm, "python", "PYTHON", program))
            languages.set_run_program(bayview::language::PYTHON, program);
    } catch (std::exception& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(workers > 0) << "Number of workers should be positive";
    CHECK(bayview::COMPILE_TIME_LIMIT >= 0) << "Compile time limit should not be negative";

    filesystem::create_directories(bayview::RUN_DIR);
    CHECK(filesystem::is_directory(bayview::RUN_DIR))
        << "Run directory " << bayview::RUN_DIR << " does not exist";

    for (auto lang : {bayview::language::C, bayview::language::CPP, bayview::language::JAVA, bayview::language::PYTHON}) {
        auto& strategy = languages.get(lang);
        for (auto* command : {&strategy.build_command, &strategy.run_command})
            if (!command->empty() && command->front().find('{') == string::npos && !bayview::find_program(command->front()))
                LOG(WARNING) << "Program " << command->front() << " for language " << bayview::get_language_tag(lang) << " is not found in PATH";
    }

    bayview::process_runner runner;
    bayview::grading_pipeline pipeline(languages, runner, bayview::RUN_DIR, bayview::COMPARE_MODE);

    if (vm.count("request") || vm.count("source")) {
        vector<bayview::submission_request> requests;
        try {
            if (vm.count("request")) {
                for (auto& file : vm.at("request").as<vector<string>>())
                    requests.push_back(bayview::server::parse_request(bayview::read_file_content(file)));
            }

            if (vm.count("source")) {
                if (!vm.count("language"))
                    throw invalid_argument("--language is required when judging a source file");
                bayview::submission_request request;
                request.prob_id = "local";
                request.user_id = "local";
                request.source = bayview::read_file_content(vm.at("source").as<string>());
                request.lang = bayview::parse_language(vm.at("language").as<string>());
                if (vm.count("input"))
                    request.input = bayview::read_file_content(vm.at("input").as<string>());
                if (vm.count("expected"))
                    request.expected_output = bayview::read_file_content(vm.at("expected").as<string>());
                request.time_limit = vm.at("time-limit").as<int>();
                if (request.time_limit <= 0)
                    throw invalid_argument("--time-limit should be positive");
                requests.push_back(move(request));
            }
        } catch (std::exception& e) {
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }

        vector<bayview::verdict> verdicts(requests.size());
        for (size_t i = 0; i < requests.size(); ++i)
            task_queue.push({requests[i], [&verdicts, i](const bayview::verdict& v) { verdicts[i] = v; }});
        judge_all(min(workers, requests.size()), pipeline);

        for (auto& v : verdicts)
            cout << bayview::server::verdict_to_json(v).dump() << endl;
        return EXIT_SUCCESS;
    }

    try {
        return serve(endpoint, workers, pipeline);
    } catch (boost::system::system_error& e) {
        LOG(ERROR) << "Unable to serve on " << endpoint << ": " << e.what();
        return EXIT_FAILURE;
    }
}
