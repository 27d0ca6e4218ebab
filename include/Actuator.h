#pragma once

#include <ode/ode.h>

#include <cmath>
#include <string>

// Base actuator interface
class Actuator {
public:
    struct Command {
        double timestamp = 0.0;
        double targetValue = 0.0;  // radians for position motors
    };

    explicit Actuator(const std::string& name)
        : name_(name), enabled_(true) {}

    virtual ~Actuator() = default;

    virtual void applyCommand(const Command& command) = 0;

    // Called once per physics step
    virtual void update(double deltaTime) = 0;

    virtual double getCurrentPosition() const = 0;
    virtual double getCurrentVelocity() const = 0;

    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    const std::string& getName() const { return name_; }

    void setPositionLimits(double min, double max) {
        minPosition_ = min;
        maxPosition_ = max;
    }
    void setVelocityLimit(double limit) { maxVelocity_ = limit; }
    void setEffortLimit(double limit) { maxEffort_ = limit; }

    double getTarget() const { return currentCommand_.targetValue; }

protected:
    std::string name_;
    bool enabled_;

    double minPosition_ = -M_PI;
    double maxPosition_ = M_PI;
    double maxVelocity_ = 8.0;
    double maxEffort_ = 20.0;

    Command currentCommand_;
};

// Position servo on a hinge joint: drives the ODE joint motor at a velocity
// proportional to the position error, with a torque ceiling
class PositionMotor : public Actuator {
public:
    PositionMotor(const std::string& name, dJointID joint, double kp = 20.0)
        : Actuator(name), joint_(joint), kp_(kp) {}

    void applyCommand(const Command& command) override;
    void update(double deltaTime) override;

    double getCurrentPosition() const override;
    double getCurrentVelocity() const override;

    void setGain(double kp) { kp_ = kp; }

private:
    dJointID joint_;
    double kp_;
};
