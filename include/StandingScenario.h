#pragma once

#include "BalanceConfig.h"
#include "SimulationEnvironment.h"
#include "StabilityMetrics.h"
#include "StandingController.h"

#include <cstddef>
#include <functional>
#include <string>

// Closed-loop standing run: settle at the baseline pose, then alternate one
// control period of physics with one controller tick until the duration ends,
// the robot falls or the caller asks to stop.
class StandingScenario {
public:
    enum class Mode {
        BASIC,        // quiet standing
        DISTURBANCE   // quiet standing with one lateral push
    };

    struct Options {
        Mode mode = Mode::BASIC;
        double duration = 10.0;          // s of closed-loop control after settling
        double pushTime = 3.0;           // s into the run
        BalanceControl::Vec3 pushForce{0.0, 50.0, 0.0};
        double pushDuration = 0.05;      // s
        bool stopOnFall = true;
        double statusInterval = 0.5;     // s between status lines, <= 0 disables
    };

    struct Result {
        BalanceControl::StabilitySummary summary;
        bool fell = false;
        bool interrupted = false;
        double fallTime = 0.0;
        std::size_t ticks = 0;
        std::size_t saturations = 0;
    };

    // Called after every tick; return false to stop the run
    using TickCallback = std::function<bool(const BalanceControl::RobotState&)>;

    // Throws ConfigurationError on an invalid configuration
    StandingScenario(const BalanceControl::BalanceConfig& config, const Options& options);

    Result run(const TickCallback& onTick = TickCallback());

    static bool parseMode(const std::string& name, Mode& mode);
    static const char* modeName(Mode mode);

    SimulationEnvironment& getEnvironment() { return environment; }
    const BalanceControl::StabilityMetrics& getMetrics() const { return metrics; }

private:
    void settle();
    void printStatus(const BalanceControl::RobotState& state) const;

    BalanceControl::BalanceConfig config;
    Options options;

    SimulationEnvironment environment;
    BalanceControl::StandingController controller;
    BalanceControl::StandingState controlState;
    BalanceControl::StabilityMetrics metrics;
};
