#include "BalanceConfigLoader.h"
#include "DebugOutput.h"

#include <yaml-cpp/yaml.h>

#include <fstream>

namespace BalanceControl {

namespace {

YAML::Node section(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = parent[key];
    if (node && !node.IsMap()) {
        throw ConfigurationError(path + " must be a mapping");
    }
    return node;
}

double readDouble(const YAML::Node& node, const char* key, double fallback, const std::string& path) {
    if (!node) return fallback;
    const YAML::Node value = node[key];
    if (!value) return fallback;
    try {
        return value.as<double>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError(path + "." + key + " is not a number");
    }
}

PIDGains readGains(const YAML::Node& parent, const char* key, const PIDGains& fallback) {
    std::string path = std::string("controller.") + key;
    YAML::Node node = section(parent, key, path);

    PIDGains gains = fallback;
    gains.kp = readDouble(node, "kp", gains.kp, path);
    gains.ki = readDouble(node, "ki", gains.ki, path);
    gains.kd = readDouble(node, "kd", gains.kd, path);
    gains.outputMin = readDouble(node, "output_min", gains.outputMin, path);
    gains.outputMax = readDouble(node, "output_max", gains.outputMax, path);
    gains.integralLimit = readDouble(node, "integral_limit", gains.integralLimit, path);
    return gains;
}

void readController(const YAML::Node& root, StandingConfig& c) {
    YAML::Node node = section(root, "controller", "controller");
    if (!node) return;

    c.targetHeight = readDouble(node, "target_height", c.targetHeight, "controller");
    c.maxCorrection = readDouble(node, "max_correction", c.maxCorrection, "controller");
    c.roll = readGains(node, "roll", c.roll);
    c.pitch = readGains(node, "pitch", c.pitch);
    c.height = readGains(node, "height", c.height);

    YAML::Node posture = section(node, "posture_mapping", "controller.posture_mapping");
    c.postureMapping.hipRollGain = readDouble(posture, "hip_roll_gain", c.postureMapping.hipRollGain, "controller.posture_mapping");
    c.postureMapping.hipPitchGain = readDouble(posture, "hip_pitch_gain", c.postureMapping.hipPitchGain, "controller.posture_mapping");
    c.postureMapping.anklePitchGain = readDouble(posture, "ankle_pitch_gain", c.postureMapping.anklePitchGain, "controller.posture_mapping");

    YAML::Node height = section(node, "height_mapping", "controller.height_mapping");
    c.heightMapping.kneeGain = readDouble(height, "knee_gain", c.heightMapping.kneeGain, "controller.height_mapping");
    c.heightMapping.hipPitchRatio = readDouble(height, "hip_pitch_ratio", c.heightMapping.hipPitchRatio, "controller.height_mapping");
    c.heightMapping.anklePitchRatio = readDouble(height, "ankle_pitch_ratio", c.heightMapping.anklePitchRatio, "controller.height_mapping");
}

void readPose(const YAML::Node& root, StandingConfig& c) {
    YAML::Node pose = section(root, "baseline_pose", "baseline_pose");
    if (pose) {
        c.baseline.clear();
        for (const auto& entry : pose) {
            std::string joint = entry.first.as<std::string>();
            try {
                c.baseline[joint] = entry.second.as<double>();
            } catch (const YAML::Exception&) {
                throw ConfigurationError("baseline_pose." + joint + " is not a number");
            }
        }
    }

    YAML::Node ranges = section(root, "joint_ranges", "joint_ranges");
    if (ranges) {
        for (const auto& entry : ranges) {
            std::string joint = entry.first.as<std::string>();
            const YAML::Node& value = entry.second;
            if (!value.IsSequence() || value.size() != 2) {
                throw ConfigurationError("joint_ranges." + joint + " must be a [min, max] pair");
            }
            try {
                c.ranges[joint] = JointRange{value[0].as<double>(), value[1].as<double>()};
            } catch (const YAML::Exception&) {
                throw ConfigurationError("joint_ranges." + joint + " must hold numbers");
            }
        }
    }
}

void readStability(const YAML::Node& root, StabilityConfig& s) {
    YAML::Node node = section(root, "stability", "stability");
    if (!node) return;

    s.minHeight = readDouble(node, "min_height", s.minHeight, "stability");
    s.maxTilt = readDouble(node, "max_tilt", s.maxTilt, "stability");
    s.maxDrift = readDouble(node, "max_drift", s.maxDrift, "stability");

    YAML::Node scales = section(node, "scales", "stability.scales");
    s.heightScale = readDouble(scales, "height", s.heightScale, "stability.scales");
    s.attitudeScale = readDouble(scales, "attitude", s.attitudeScale, "stability.scales");
    s.driftScale = readDouble(scales, "drift", s.driftScale, "stability.scales");

    YAML::Node weights = section(node, "weights", "stability.weights");
    s.heightWeight = readDouble(weights, "height", s.heightWeight, "stability.weights");
    s.attitudeWeight = readDouble(weights, "attitude", s.attitudeWeight, "stability.weights");
    s.driftWeight = readDouble(weights, "drift", s.driftWeight, "stability.weights");
}

void readSimulation(const YAML::Node& root, SimulationConfig& s) {
    YAML::Node node = section(root, "simulation", "simulation");
    if (!node) return;

    s.timeStep = readDouble(node, "time_step", s.timeStep, "simulation");
    s.controlPeriod = readDouble(node, "control_period", s.controlPeriod, "simulation");
    s.gravity = readDouble(node, "gravity", s.gravity, "simulation");
    s.groundFriction = readDouble(node, "ground_friction", s.groundFriction, "simulation");
    s.servoGain = readDouble(node, "servo_gain", s.servoGain, "simulation");
    s.servoMaxVelocity = readDouble(node, "servo_max_velocity", s.servoMaxVelocity, "simulation");
    s.servoMaxTorque = readDouble(node, "servo_max_torque", s.servoMaxTorque, "simulation");
    s.imuNoiseLevel = readDouble(node, "imu_noise_level", s.imuNoiseLevel, "simulation");
    s.settleTime = readDouble(node, "settle_time", s.settleTime, "simulation");

    if (node["noise_seed"]) {
        try {
            s.noiseSeed = node["noise_seed"].as<long>();
        } catch (const YAML::Exception&) {
            throw ConfigurationError("simulation.noise_seed is not an integer");
        }
    }
}

BalanceConfig fromNode(const YAML::Node& root) {
    BalanceConfig config;
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("configuration root must be a mapping");
    }

    if (root["log_level"]) {
        config.logLevel = root["log_level"].as<std::string>();
    }
    readController(root, config.controller);
    readPose(root, config.controller);
    readStability(root, config.stability);
    readSimulation(root, config.simulation);

    config.validate();
    return config;
}

void emitGains(YAML::Emitter& out, const char* key, const PIDGains& g) {
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "kp" << YAML::Value << g.kp;
    out << YAML::Key << "ki" << YAML::Value << g.ki;
    out << YAML::Key << "kd" << YAML::Value << g.kd;
    out << YAML::Key << "output_min" << YAML::Value << g.outputMin;
    out << YAML::Key << "output_max" << YAML::Value << g.outputMax;
    out << YAML::Key << "integral_limit" << YAML::Value << g.integralLimit;
    out << YAML::EndMap;
}

} // namespace

BalanceConfig BalanceConfigLoader::load(const std::string& filepath) {
    try {
        BalanceConfig config = fromNode(YAML::LoadFile(filepath));
        DEBUG_INFO("[Config] Loaded " + filepath);
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("failed to read " + filepath + ": " + e.what());
    }
}

BalanceConfig BalanceConfigLoader::parse(const std::string& yamlText) {
    try {
        return fromNode(YAML::Load(yamlText));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("YAML parsing error: ") + e.what());
    }
}

std::string BalanceConfigLoader::emit(const BalanceConfig& config) {
    const StandingConfig& c = config.controller;
    const StabilityConfig& s = config.stability;
    const SimulationConfig& sim = config.simulation;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << config.logLevel;

    out << YAML::Key << "controller" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "target_height" << YAML::Value << c.targetHeight;
    out << YAML::Key << "max_correction" << YAML::Value << c.maxCorrection;
    emitGains(out, "roll", c.roll);
    emitGains(out, "pitch", c.pitch);
    emitGains(out, "height", c.height);
    out << YAML::Key << "posture_mapping" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "hip_roll_gain" << YAML::Value << c.postureMapping.hipRollGain;
    out << YAML::Key << "hip_pitch_gain" << YAML::Value << c.postureMapping.hipPitchGain;
    out << YAML::Key << "ankle_pitch_gain" << YAML::Value << c.postureMapping.anklePitchGain;
    out << YAML::EndMap;
    out << YAML::Key << "height_mapping" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "knee_gain" << YAML::Value << c.heightMapping.kneeGain;
    out << YAML::Key << "hip_pitch_ratio" << YAML::Value << c.heightMapping.hipPitchRatio;
    out << YAML::Key << "ankle_pitch_ratio" << YAML::Value << c.heightMapping.anklePitchRatio;
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::Key << "baseline_pose" << YAML::Value << YAML::BeginMap;
    for (const auto& [joint, angle] : c.baseline) {
        out << YAML::Key << joint << YAML::Value << angle;
    }
    out << YAML::EndMap;

    out << YAML::Key << "joint_ranges" << YAML::Value << YAML::BeginMap;
    for (const auto& [joint, range] : c.ranges) {
        out << YAML::Key << joint << YAML::Value << YAML::Flow << YAML::BeginSeq
            << range.min << range.max << YAML::EndSeq;
    }
    out << YAML::EndMap;

    out << YAML::Key << "stability" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "min_height" << YAML::Value << s.minHeight;
    out << YAML::Key << "max_tilt" << YAML::Value << s.maxTilt;
    out << YAML::Key << "max_drift" << YAML::Value << s.maxDrift;
    out << YAML::Key << "scales" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "height" << YAML::Value << s.heightScale;
    out << YAML::Key << "attitude" << YAML::Value << s.attitudeScale;
    out << YAML::Key << "drift" << YAML::Value << s.driftScale;
    out << YAML::EndMap;
    out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "height" << YAML::Value << s.heightWeight;
    out << YAML::Key << "attitude" << YAML::Value << s.attitudeWeight;
    out << YAML::Key << "drift" << YAML::Value << s.driftWeight;
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::Key << "simulation" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "time_step" << YAML::Value << sim.timeStep;
    out << YAML::Key << "control_period" << YAML::Value << sim.controlPeriod;
    out << YAML::Key << "gravity" << YAML::Value << sim.gravity;
    out << YAML::Key << "ground_friction" << YAML::Value << sim.groundFriction;
    out << YAML::Key << "servo_gain" << YAML::Value << sim.servoGain;
    out << YAML::Key << "servo_max_velocity" << YAML::Value << sim.servoMaxVelocity;
    out << YAML::Key << "servo_max_torque" << YAML::Value << sim.servoMaxTorque;
    out << YAML::Key << "imu_noise_level" << YAML::Value << sim.imuNoiseLevel;
    out << YAML::Key << "noise_seed" << YAML::Value << sim.noiseSeed;
    out << YAML::Key << "settle_time" << YAML::Value << sim.settleTime;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

void BalanceConfigLoader::save(const std::string& filepath, const BalanceConfig& config) {
    std::ofstream file(filepath);
    if (!file) {
        throw ConfigurationError("cannot open " + filepath + " for writing");
    }
    file << emit(config) << std::endl;
    if (!file) {
        throw ConfigurationError("failed writing " + filepath);
    }
}

} // namespace BalanceControl
