#include <iostream>
#include <memory>
#include <csignal>
#include <curl/curl.h>
#include <boost/program_options.hpp>
#include "app_config.h"
#include "logger.h"
#include "pipeline.h"
#include "components/sink/audit_log.h"

namespace po = boost::program_options;
using namespace facegate;

// Pipeline reachable from the signal handler
std::unique_ptr<Pipeline> pipeline;

// First SIGINT/SIGTERM asks the render loop to stop; a second one restores the
// default disposition so a further signal terminates the process
void signalHandler(int signal) {
    static bool shutdownInProgress = false;

    const char* name = signal == SIGINT ? "SIGINT" : (signal == SIGTERM ? "SIGTERM" : "signal");
    if (shutdownInProgress) {
        std::cout << "\n" << name << " received again, press Ctrl+C once more to force exit" << std::endl;
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        return;
    }

    shutdownInProgress = true;
    std::cout << "\n" << name << " received, stopping facegate..." << std::endl;
    if (pipeline) {
        pipeline->requestShutdown();
    }
}

// Command line values override the configuration file
void applyCommandLine(AppConfig& config, const po::variables_map& vm) {
    if (vm.count("source")) {
        config.source.uri = vm["source"].as<std::string>();
    }
    if (vm.count("server-url")) {
        config.inference.serverUrl = vm["server-url"].as<std::string>();
    }
    if (vm.count("user")) {
        config.registration.userId = vm["user"].as<std::string>();
    }
    if (vm.count("samples")) {
        config.registration.samples = vm["samples"].as<int>();
    }
    if (vm.count("no-display")) {
        config.display.enabled = false;
    }
}

// Print the most recent audit rows, newest first, one JSON object per line
int printHistory(const AppConfig& config, int limit) {
    SqliteAuditLog auditLog("audit_log", config.audit.dbPath);
    if (!auditLog.initialize()) {
        LOG_ERROR("Main", "Cannot open audit database " + config.audit.dbPath);
        return 1;
    }

    auto records = auditLog.recentRecords(limit);
    if (records.isError()) {
        LOG_ERROR("Main", "Failed to read audit log: " + records.getErrorDetail().toString());
        return 1;
    }

    for (const auto& record : records.getValue()) {
        std::cout << record.toJson().dump() << std::endl;
    }
    return 0;
}

int runPipeline(const AppConfig& config, Pipeline::Mode mode) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_FATAL("Main", "Failed to initialize libcurl");
        return 1;
    }

    int exitCode = 0;
    try {
        pipeline = std::make_unique<Pipeline>(config, mode, Pipeline::createDefaultDependencies(config, mode));

        auto started = pipeline->start();
        if (started.isError()) {
            LOG_FATAL("Main", "Failed to start pipeline: " + started.getErrorDetail().toString());
            exitCode = 1;
        } else {
            LOG_INFO("Main", "facegate running, press q or Ctrl+C to stop");
            exitCode = pipeline->run();
        }

        pipeline.reset();
    } catch (const std::exception& e) {
        LOG_FATAL("Main", std::string("Fatal error: ") + e.what());
        pipeline.reset();
        exitCode = 1;
    }

    curl_global_cleanup();
    return exitCode;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    po::options_description desc("facegate options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("mode,m", po::value<std::string>()->default_value("run"), "Mode (run, register, history)")
        ("source,s", po::value<std::string>(), "Camera index or stream URL")
        ("server-url", po::value<std::string>(), "Base URL of the face inference service")
        ("user,u", po::value<std::string>(), "Name to register (register mode)")
        ("samples", po::value<int>(), "Number of face samples to register")
        ("limit", po::value<int>()->default_value(20), "Number of rows to print (history mode)")
        ("no-display", "Run without a preview window")
        ("log-level", po::value<std::string>()->default_value("info"), "Log level (trace, debug, info, warn, error, fatal, off)")
        ("log-file", po::value<std::string>(), "Log file path");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cout << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << "facegate - face recognition access control" << std::endl;
        std::cout << desc << std::endl;
        return 0;
    }

    Logger::getInstance().setLogLevel(parseLogLevel(vm["log-level"].as<std::string>()));
    if (vm.count("log-file")) {
        const std::string logFilePath = vm["log-file"].as<std::string>();
        if (!Logger::getInstance().setOutputFile(logFilePath)) {
            std::cerr << "Failed to open log file: " << logFilePath << std::endl;
            return 1;
        }
    }

    const std::string modeName = vm["mode"].as<std::string>();
    if (modeName != "run" && modeName != "register" && modeName != "history") {
        std::cerr << "Error: unknown mode '" << modeName << "'" << std::endl;
        std::cout << desc << std::endl;
        return 1;
    }

    // defaults < file < command line < environment
    AppConfig config;
    if (vm.count("config")) {
        auto loaded = AppConfig::fromFile(vm["config"].as<std::string>());
        if (loaded.isError()) {
            LOG_ERROR("Main", "Failed to load configuration: " + loaded.getErrorDetail().toString());
            return 1;
        }
        config = loaded.moveValue();
    }
    applyCommandLine(config, vm);
    config.applyEnvironment();

    auto valid = config.validate();
    if (valid.isError()) {
        LOG_ERROR("Main", "Invalid configuration: " + valid.getErrorDetail().toString());
        return 1;
    }
    LOG_DEBUG("Main", "Configuration: " + config.toJson().dump());

    if (modeName == "history") {
        return printHistory(config, vm["limit"].as<int>());
    }

    int exitCode = runPipeline(config, modeName == "register" ? Pipeline::Mode::Registration
                                                              : Pipeline::Mode::Recognition);
    if (exitCode == 0) {
        LOG_INFO("Main", "facegate shut down cleanly");
    }
    return exitCode;
}
