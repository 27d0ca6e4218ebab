#include "NoiseManager.h"
#include "DebugOutput.h"

#include <algorithm>
#include <sstream>

NoiseManager::NoiseManager(long seed) : noiseLevel(0.0) {
    randGen = std::make_unique<RandGen>();
    randGen->init(seed);

    sensorNoiseGen = std::make_unique<WhiteUniformNoise>();
    sensorNoiseGen->init(IMU_CHANNELS, randGen.get());

    std::ostringstream oss;
    oss << "[NoiseManager] " << IMU_CHANNELS << " IMU channels, seed " << seed;
    DEBUG_VERBOSE(oss.str());
}

NoiseManager::~NoiseManager() {
    // Generator holds a raw pointer to randGen
    sensorNoiseGen.reset();
}

void NoiseManager::setNoiseLevel(double level) {
    noiseLevel = std::max(0.0, level);
}

void NoiseManager::applySensorNoise(double* values, unsigned int count) {
    if (noiseLevel > 0.0 && sensorNoiseGen && count <= sensorNoiseGen->getDimension()) {
        for (unsigned int i = 0; i < count; ++i) {
            values[i] += sensorNoiseGen->generate() * noiseLevel;
        }
    }
}

void NoiseManager::applyIMUNoise(BalanceControl::ImuReading& imu) {
    if (noiseLevel <= 0.0) return;

    double channels[IMU_CHANNELS] = {
        imu.angularVelocity.x, imu.angularVelocity.y, imu.angularVelocity.z,
        imu.linearAcceleration.x, imu.linearAcceleration.y, imu.linearAcceleration.z
    };
    applySensorNoise(channels, IMU_CHANNELS);

    imu.angularVelocity = BalanceControl::Vec3{channels[0], channels[1], channels[2]};
    imu.linearAcceleration = BalanceControl::Vec3{channels[3], channels[4], channels[5]};
}
