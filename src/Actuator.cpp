#include "Actuator.h"

#include <algorithm>
#include <cmath>

void PositionMotor::applyCommand(const Command& command) {
    if (!enabled_) return;
    currentCommand_ = command;

    currentCommand_.targetValue = std::clamp(
        currentCommand_.targetValue,
        minPosition_,
        maxPosition_
    );
}

void PositionMotor::update(double /*deltaTime*/) {
    if (!joint_) return;

    if (!enabled_) {
        // Limp
        dJointSetHingeParam(joint_, dParamFMax, 0.0);
        return;
    }

    double posError = currentCommand_.targetValue - getCurrentPosition();
    double targetVel = std::clamp(kp_ * posError, -maxVelocity_, maxVelocity_);

    dJointSetHingeParam(joint_, dParamVel, targetVel);
    dJointSetHingeParam(joint_, dParamFMax, maxEffort_);
}

double PositionMotor::getCurrentPosition() const {
    if (!joint_) return 0.0;
    return dJointGetHingeAngle(joint_);
}

double PositionMotor::getCurrentVelocity() const {
    if (!joint_) return 0.0;
    return dJointGetHingeAngleRate(joint_);
}
