#include "StandingScenario.h"
#include "DebugOutput.h"

#include <cmath>
#include <iomanip>
#include <sstream>

using namespace BalanceControl;

StandingScenario::StandingScenario(const BalanceConfig& config, const Options& options)
    : config(config),
      options(options),
      environment(config.simulation, config.controller.ranges),
      controller(config.controller),
      metrics(config.stability) {
    if (!std::isfinite(options.duration) || options.duration <= 0.0) {
        throw ConfigurationError("scenario duration must be positive");
    }
}

bool StandingScenario::parseMode(const std::string& name, Mode& mode) {
    if (name == "basic") {
        mode = Mode::BASIC;
        return true;
    }
    if (name == "disturbance") {
        mode = Mode::DISTURBANCE;
        return true;
    }
    return false;
}

const char* StandingScenario::modeName(Mode mode) {
    switch (mode) {
        case Mode::BASIC: return "basic";
        case Mode::DISTURBANCE: return "disturbance";
    }
    return "unknown";
}

void StandingScenario::settle() {
    environment.setJointPositions(config.controller.baseline);
    environment.stepFor(config.simulation.settleTime);

    BaseState base = environment.getBaseState();
    std::ostringstream oss;
    oss << "[Scenario] Settled at h=" << std::fixed << std::setprecision(4) << base.position.z
        << "m roll=" << std::setprecision(2) << base.orientation.roll
        << " pitch=" << base.orientation.pitch;
    DEBUG_INFO(oss.str());
}

StandingScenario::Result StandingScenario::run(const TickCallback& onTick) {
    Result result;

    settle();
    StandingController::reset(controlState);
    metrics.reset();

    const double dt = config.simulation.controlPeriod;
    const int stepsPerTick = config.simulation.stepsPerControl();
    const double start = environment.getTime();
    bool pushed = false;
    double nextStatus = 0.0;

    std::ostringstream banner;
    banner << "[Scenario] Running '" << modeName(options.mode) << "' for " << options.duration
           << " s, " << stepsPerTick << " physics steps per tick";
    DEBUG_INFO(banner.str());

    while (environment.getTime() - start < options.duration - 1e-9) {
        double elapsed = environment.getTime() - start;

        if (options.mode == Mode::DISTURBANCE && !pushed && elapsed >= options.pushTime) {
            environment.applyExternalForce(options.pushForce, options.pushDuration);
            pushed = true;
        }

        for (int i = 0; i < stepsPerTick; ++i) {
            environment.step();
        }

        RobotState state = environment.getRobotState();
        state.timestamp -= start;

        metrics.update(state);
        ControlCommand command = controller.compute(controlState, state, dt);
        environment.setJointPositions(command);
        ++result.ticks;

        if (options.statusInterval > 0.0 && state.timestamp >= nextStatus) {
            printStatus(state);
            nextStatus += options.statusInterval;
        }

        if (!metrics.isStable() && !result.fell) {
            std::ostringstream oss;
            oss << "[Scenario] Robot lost balance at t=" << std::fixed << std::setprecision(2)
                << state.timestamp << "s (h=" << std::setprecision(3) << state.base.position.z << "m)";
            DEBUG_WARNING(oss.str());
            result.fell = true;
            result.fallTime = state.timestamp;
        }
        if (result.fell && options.stopOnFall) {
            break;
        }

        if (onTick && !onTick(state)) {
            result.interrupted = true;
            break;
        }
    }

    result.summary = metrics.summary();
    result.saturations = controlState.totalSaturations;
    return result;
}

void StandingScenario::printStatus(const RobotState& state) const {
    SimulationEnvironment::FootContacts feet = environment.getFootContacts();

    std::ostringstream oss;
    oss << std::fixed
        << "t=" << std::setw(6) << std::setprecision(2) << state.timestamp << "s"
        << "  h=" << std::setprecision(4) << state.base.position.z << "m"
        << "  roll=" << std::showpos << std::setprecision(2) << state.base.orientation.roll
        << "  pitch=" << state.base.orientation.pitch << std::noshowpos
        << "  feet=" << (feet.left ? "L" : "-") << (feet.right ? "R" : "-")
        << "  saturations=" << controlState.totalSaturations;
    DEBUG_INFO(oss.str());
}
