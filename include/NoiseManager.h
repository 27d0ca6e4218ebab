#pragma once

#include "BalanceTypes.h"

#include "noisegenerator.h"

#include <memory>

// Seeded uniform sensor noise for the simulated IMU. One instance per
// environment so that runs with the same seed are reproducible.
class NoiseManager {
public:
    explicit NoiseManager(long seed);
    ~NoiseManager();

    NoiseManager(const NoiseManager&) = delete;
    NoiseManager& operator=(const NoiseManager&) = delete;

    // Amplitude of the uniform noise in channel units; 0 disables it
    void setNoiseLevel(double level);
    double getNoiseLevel() const { return noiseLevel; }

    // Adds noise to angular velocity and linear acceleration. Orientation is left exact.
    void applyIMUNoise(BalanceControl::ImuReading& imu);

    // Adds noise to count values, count must not exceed IMU_CHANNELS
    void applySensorNoise(double* values, unsigned int count);

    static constexpr unsigned int IMU_CHANNELS = 6;

private:
    std::unique_ptr<RandGen> randGen;
    std::unique_ptr<WhiteUniformNoise> sensorNoiseGen;
    double noiseLevel;
};
