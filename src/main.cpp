#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "BalanceConfigLoader.h"
#include "DebugOutput.h"
#include "PhysicsWorld.h"
#include "StandingScenario.h"
#include "Visualizer.h"

#include <vsg/all.h>

using namespace BalanceControl;

namespace {

const char* kDefaultConfigPath = "config/balance_config.yaml";

enum ExitCode {
    EXIT_STABLE = 0,
    EXIT_ERROR = 1,
    EXIT_CONFIG = 2,
    EXIT_INPUT = 3,
    EXIT_FELL = 4
};

struct CommandLine {
    std::string configPath;
    std::string dumpPath;
    std::string mode = "basic";
    double duration = 10.0;
    bool gui = false;
    bool realtime = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

// Global flag for graceful shutdown
std::atomic<bool> g_shouldExit{false};

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down gracefully..." << std::endl;
    g_shouldExit = true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config FILE        YAML configuration (default " << kDefaultConfigPath << " if present)\n"
              << "  --mode MODE          basic | disturbance (default basic)\n"
              << "  --duration S         seconds of closed-loop control (default 10)\n"
              << "  --gui                open a VulkanSceneGraph window\n"
              << "  --realtime           pace the simulation to wall-clock time\n"
              << "  --verbose            log controller saturations and diagnostics\n"
              << "  --quiet              only log errors\n"
              << "  --dump-config FILE   write the effective configuration and exit\n"
              << "  --help               show this message\n";
}

// Throws InvalidInput on malformed arguments
CommandLine parseCommandLine(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw InvalidInput(flag + " expects a value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            cli.configPath = value(arg);
        } else if (arg == "--dump-config") {
            cli.dumpPath = value(arg);
        } else if (arg == "--mode") {
            cli.mode = value(arg);
        } else if (arg == "--duration") {
            std::string text = value(arg);
            std::istringstream iss(text);
            if (!(iss >> cli.duration) || !iss.eof()) {
                throw InvalidInput("--duration expects a number, got '" + text + "'");
            }
        } else if (arg == "--gui") {
            cli.gui = true;
        } else if (arg == "--realtime") {
            cli.realtime = true;
        } else if (arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "--quiet") {
            cli.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else {
            throw InvalidInput("unknown argument '" + arg + "'");
        }
    }
    if (cli.verbose && cli.quiet) {
        throw InvalidInput("--verbose and --quiet are mutually exclusive");
    }
    return cli;
}

BalanceConfig loadConfig(const CommandLine& cli) {
    if (!cli.configPath.empty()) {
        return BalanceConfigLoader::load(cli.configPath);
    }
    if (std::ifstream(kDefaultConfigPath).good()) {
        return BalanceConfigLoader::load(kDefaultConfigPath);
    }
    DEBUG_INFO("No configuration file, using compiled defaults");
    BalanceConfig config;
    config.validate();
    return config;
}

void applyLogLevel(const CommandLine& cli, const BalanceConfig& config) {
    Debug::Level level = Debug::INFO;
    Debug::parseLevel(config.logLevel, level);
    if (cli.verbose) {
        level = Debug::VERBOSE;
    } else if (cli.quiet) {
        level = Debug::ERROR;
    }
    Debug::setLevel(level);
    DEBUG_VERBOSE(std::string("Log level: ") + Debug::levelName(level));
}

void printReport(const StandingScenario::Result& result, const std::string& mode) {
    std::cout << "\n=== Stability report (" << mode << ") ===" << std::endl;
    std::cout << std::fixed;
    for (const auto& [key, value] : result.summary.toRecord()) {
        std::cout << "  " << std::left << std::setw(16) << key << std::right
                  << std::setprecision(4) << value << std::endl;
    }
    std::cout << "  " << std::left << std::setw(16) << "saturations" << std::right
              << result.saturations << std::endl;
    if (result.fell) {
        std::cout << "  Robot fell at t=" << std::setprecision(2) << result.fallTime << "s" << std::endl;
    } else if (result.interrupted) {
        std::cout << "  Run interrupted after " << result.ticks << " ticks" << std::endl;
    }
    std::cout << "  Verdict: " << (result.summary.isStable ? "STABLE" : "UNSTABLE") << std::endl;
}

int run(const CommandLine& cli) {
    BalanceConfig config = loadConfig(cli);
    applyLogLevel(cli, config);

    if (!cli.dumpPath.empty()) {
        BalanceConfigLoader::save(cli.dumpPath, config);
        DEBUG_INFO("Configuration written to " + cli.dumpPath);
        return EXIT_STABLE;
    }

    StandingScenario::Options options;
    if (!StandingScenario::parseMode(cli.mode, options.mode)) {
        throw InvalidInput("unknown mode '" + cli.mode + "', expected basic or disturbance");
    }
    options.duration = cli.duration;

    // Scope ODE so every body and joint is gone before dCloseODE
    OdeSession ode;
    StandingScenario scenario(config, options);

    std::unique_ptr<Visualizer> visualizer;
    if (cli.gui) {
        visualizer = std::make_unique<Visualizer>();
        if (!visualizer->initialize(scenario.getEnvironment().getRobot())) {
            DEBUG_WARNING("Visualizer unavailable, continuing headless");
            visualizer.reset();
        }
    }

    const auto tickPeriod = std::chrono::duration<double>(config.simulation.controlPeriod);
    std::chrono::steady_clock::time_point nextTick;
    bool paceStarted = false;

    StandingScenario::Result result = scenario.run([&](const RobotState& state) {
        if (g_shouldExit) {
            return false;
        }
        if (visualizer) {
            if (visualizer->shouldClose()) {
                return false;
            }
            visualizer->syncFromPhysics();
            visualizer->setCameraTarget(state.base.position);
            if (!visualizer->render()) {
                return false;
            }
        }
        if (cli.realtime) {
            // Clock starts at the first control tick, after settling
            if (!paceStarted) {
                nextTick = std::chrono::steady_clock::now();
                paceStarted = true;
            }
            nextTick += std::chrono::duration_cast<std::chrono::steady_clock::duration>(tickPeriod);
            std::this_thread::sleep_until(nextTick);
        }
        return true;
    });

    printReport(result, StandingScenario::modeName(options.mode));

    if (visualizer) {
        visualizer->close();
    }
    return result.summary.isStable ? EXIT_STABLE : EXIT_FELL;
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Register signal handler for graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        CommandLine cli = parseCommandLine(argc, argv);
        if (cli.help) {
            printUsage(argv[0]);
            return EXIT_STABLE;
        }
        return run(cli);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_CONFIG;
    } catch (const InvalidInput& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        printUsage(argv[0]);
        return EXIT_INPUT;
    } catch (const vsg::Exception& e) {
        std::cerr << "VSG Error: " << e.message << std::endl;
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}
