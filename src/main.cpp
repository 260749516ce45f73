#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <boost/program_options.hpp>
#include "camera_manager.h"
#include "component_factory.h"
#include "errors.h"
#include "logger.h"
#include "pipeline_config.h"

namespace po = boost::program_options;
using namespace zwatch;

namespace {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_ALL_CAMERAS_FAILED = 2;

std::atomic<bool> shutdownRequested(false);

// Only flips the flag; the main thread does the actual shutdown
void signalHandler(int signal) {
    if (shutdownRequested.exchange(true)) {
        // Second signal: the default handler terminates the process
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        return;
    }
    (void)signal;
}

AppConfig buildConfig(const po::variables_map& vm) {
    AppConfig config;
    if (vm.count("config")) {
        config = AppConfig::loadFromFile(vm["config"].as<std::string>());
    }

    if (vm.count("video")) {
        if (config.cameras.empty()) {
            CameraConfig camera;
            camera.id = "cam0";
            camera.name = "default";
            config.cameras.push_back(camera);
        }
        config.cameras.front().source.url = vm["video"].as<std::string>();
    }

    for (auto& camera : config.cameras) {
        if (vm.count("zones")) {
            camera.zones.file = vm["zones"].as<std::string>();
        }
        if (vm.count("debounce")) {
            camera.zones.debounceFrames = vm["debounce"].as<int>();
        }
        if (vm.count("confidence")) {
            camera.detector.confidenceThreshold = vm["confidence"].as<float>();
        }
    }

    if (vm.count("log-level")) {
        config.logging.level = vm["log-level"].as<std::string>();
    }
    if (vm.count("log-file")) {
        config.logging.file = vm["log-file"].as<std::string>();
    }

    config.validate();
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Runtime configuration file (JSON)")
        ("video,v", po::value<std::string>(), "Video URI (rtsp://, http://, file path); overrides the first camera's source")
        ("zones,z", po::value<std::string>(), "Zone configuration file; overrides every camera's zones file")
        ("log-level", po::value<std::string>(), "Log level (trace, debug, info, warn, error, fatal, off)")
        ("log-file", po::value<std::string>(), "Log file path")
        ("headless", po::bool_switch()->default_value(false), "Disable display windows")
        ("debounce", po::value<int>(), "Consecutive frames required to commit a zone transition")
        ("confidence", po::value<float>(), "Minimum person detection confidence");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "zonewatch - Person zone occupancy monitor" << std::endl;
            std::cout << desc << std::endl;
            return EXIT_CLEAN;
        }
        if (!vm.count("config") && !vm.count("video")) {
            std::cerr << "Error: either --config or --video is required" << std::endl;
            std::cout << desc << std::endl;
            return EXIT_CONFIG_ERROR;
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cout << desc << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    AppConfig config;
    try {
        config = buildConfig(vm);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    Logger::getInstance().setLogLevel(stringToLogLevel(config.logging.level));
    Logger::getInstance().enableConsoleLogging(config.logging.console);
    if (!config.logging.file.empty()) {
        if (!Logger::getInstance().setOutputFile(config.logging.file)) {
            std::cerr << "Failed to open log file: " << config.logging.file << std::endl;
            return EXIT_CONFIG_ERROR;
        }
        LOG_INFO("Main", "Logging to file: " + config.logging.file);
    }
    LOG_INFO("Main", "Log level set to: " + config.logging.level);

    FactoryOptions options;
    options.headless = vm["headless"].as<bool>();
    ComponentFactory::getInstance().setOptions(options);

    CameraManager manager;
    try {
        manager.createCameras(config.cameras);
    } catch (const ConfigError& e) {
        LOG_FATAL("Main", std::string("Configuration error: ") + e.what());
        return EXIT_CONFIG_ERROR;
    }

    LOG_INFO("Main", "Starting " + std::to_string(config.cameras.size()) + " camera(s)");
    manager.startAll();

    // Poll until a signal arrives or no camera is running any more
    while (!shutdownRequested) {
        bool anyRunning = false;
        for (const auto& camera : manager.getAllCameras()) {
            anyRunning = anyRunning || camera->isRunning();
        }
        if (!anyRunning) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (shutdownRequested) {
        LOG_INFO("Main", "Shutdown requested, stopping cameras...");
    }
    manager.stopAll();

    LOG_INFO("Main", "Final status: " + manager.status().dump());

    if (manager.allFailed()) {
        LOG_ERROR("Main", "Every camera failed");
        return EXIT_ALL_CAMERAS_FAILED;
    }

    LOG_INFO("Main", "zonewatch shut down successfully");
    return EXIT_CLEAN;
}
