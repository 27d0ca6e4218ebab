#include "BipedRobot.h"
#include "DebugOutput.h"

#include <algorithm>
#include <cmath>
#include <sstream>

using BalanceControl::JointRange;
using BalanceControl::JointState;
using BalanceControl::LegSide;
using BalanceControl::Vec3;

namespace {

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;

} // namespace

BipedRobot::BipedRobot(PhysicsWorld& world, const BalanceControl::JointRanges& ranges,
                       const BalanceControl::SimulationConfig& sim, const Config& config)
    : physics(world), ranges(ranges), simConfig(sim), config(config) {
    createBody();
    createLeg(LegSide::LEFT);
    createLeg(LegSide::RIGHT);

    std::ostringstream oss;
    oss << "[BipedRobot] Created " << links.size() << " links and " << joints.size()
        << " joints, pelvis at Z=" << getPelvisPosition().z;
    DEBUG_INFO(oss.str());
}

double BipedRobot::standingHeight() const {
    return config.ankleHeight + config.calfLength + config.thighLength;
}

void BipedRobot::createBody() {
    double pelvisZ = standingHeight() + config.spawnClearance;
    double torsoZ = pelvisZ + config.torsoSize.z * 0.5;

    torso = addLink("torso", Shape::BOX, Vec3{0.0, 0.0, torsoZ}, config.torsoSize, config.torsoMass);

    double neckZ = torsoZ + config.torsoSize.z * 0.5;
    dBodyID head = addLink("head", Shape::SPHERE, Vec3{0.0, 0.0, neckZ + config.headRadius},
                           Vec3{config.headRadius, config.headRadius, config.headRadius}, config.headMass);
    addJoint(BalanceControl::Joints::HEAD_PITCH, torso, head, Vec3{0.0, 0.0, neckZ}, Vec3{0.0, 1.0, 0.0});
}

void BipedRobot::createLeg(LegSide side) {
    const bool left = (side == LegSide::LEFT);
    const std::string prefix = left ? "left_" : "right_";
    const double y = left ? config.hipOffsetY : -config.hipOffsetY;
    const double r = config.legRadius;

    const double pelvisZ = standingHeight() + config.spawnClearance;
    const double kneeZ = pelvisZ - config.thighLength;
    const double ankleZ = kneeZ - config.calfLength;

    // Hip link carries the roll axis
    double s = config.hipLinkSize;
    dBodyID hip = addLink(prefix + "hip", Shape::BOX, Vec3{0.0, y, pelvisZ}, Vec3{s, s, s}, config.hipLinkMass);
    // Mirrored roll axes so that positive is adduction on both sides
    addJoint(prefix + "hip_roll", torso, hip, Vec3{0.0, y, pelvisZ}, Vec3{left ? 1.0 : -1.0, 0.0, 0.0});

    dBodyID thigh = addLink(prefix + "thigh", Shape::CAPSULE,
                            Vec3{0.0, y, pelvisZ - config.thighLength * 0.5},
                            Vec3{r, r, config.thighLength - 2.0 * r}, config.thighMass);
    addJoint(prefix + "hip_pitch", hip, thigh, Vec3{0.0, y, pelvisZ}, Vec3{0.0, 1.0, 0.0});

    dBodyID calf = addLink(prefix + "calf", Shape::CAPSULE,
                           Vec3{0.0, y, kneeZ - config.calfLength * 0.5},
                           Vec3{r, r, config.calfLength - 2.0 * r}, config.calfMass);
    addJoint(prefix + "knee", thigh, calf, Vec3{0.0, y, kneeZ}, Vec3{0.0, -1.0, 0.0});

    dBodyID foot = addLink(prefix + "foot", Shape::BOX,
                           Vec3{0.0, y, ankleZ - config.ankleHeight + config.footSize.z * 0.5},
                           config.footSize, config.footMass);
    addJoint(prefix + "ankle_pitch", calf, foot, Vec3{0.0, y, ankleZ}, Vec3{0.0, -1.0, 0.0});

    if (left) {
        leftFoot = physics.getGeom(foot);
    } else {
        rightFoot = physics.getGeom(foot);
    }
}

dBodyID BipedRobot::addLink(const std::string& name, Shape shape, const Vec3& position,
                            const Vec3& size, double mass) {
    dBodyID body = nullptr;
    switch (shape) {
        case Shape::BOX:
            body = physics.createBox(position, size, mass);
            break;
        case Shape::CAPSULE:
            body = physics.createCapsule(position, size.x, size.z, mass);
            break;
        case Shape::SPHERE:
            body = physics.createSphere(position, size.x, mass);
            break;
    }

    Link link;
    link.name = name;
    link.body = body;
    link.geom = physics.getGeom(body);
    link.shape = shape;
    link.size = size;
    links.push_back(link);
    return body;
}

void BipedRobot::addJoint(const std::string& name, dBodyID parent, dBodyID child,
                          const Vec3& anchor, const Vec3& axis) {
    auto rangeIt = ranges.find(name);
    if (rangeIt == ranges.end()) {
        throw BalanceControl::ConfigurationError("joint '" + name + "' has no declared range");
    }
    const JointRange& range = rangeIt->second;

    dJointID joint = dJointCreateHinge(physics.getWorld(), 0);
    dJointAttach(joint, parent, child);
    dJointSetHingeAnchor(joint, anchor.x, anchor.y, anchor.z);
    dJointSetHingeAxis(joint, axis.x, axis.y, axis.z);

    // Stops must straddle the spawn angle of zero
    double lo = std::min(range.min, 0.0) * kDegToRad;
    double hi = std::max(range.max, 0.0) * kDegToRad;
    dJointSetHingeParam(joint, dParamLoStop, lo);
    dJointSetHingeParam(joint, dParamHiStop, hi);
    dJointSetHingeParam(joint, dParamStopERP, 0.8);
    dJointSetHingeParam(joint, dParamStopCFM, 1e-5);

    auto motor = std::make_unique<PositionMotor>(name, joint, simConfig.servoGain);
    motor->setPositionLimits(range.min * kDegToRad, range.max * kDegToRad);
    motor->setVelocityLimit(simConfig.servoMaxVelocity);
    motor->setEffortLimit(simConfig.servoMaxTorque);

    // Hold the spawn pose until the first command arrives
    Actuator::Command hold;
    hold.targetValue = range.clamp(0.0) * kDegToRad;
    motor->applyCommand(hold);

    Joint j;
    j.name = name;
    j.joint = joint;
    j.motor = std::move(motor);
    j.range = range;
    joints.emplace(name, std::move(j));
}

void BipedRobot::updateMotors(double deltaTime) {
    for (auto& [name, joint] : joints) {
        joint.motor->update(deltaTime);
    }
}

bool BipedRobot::setJointTarget(const std::string& name, double degrees) {
    auto it = joints.find(name);
    if (it == joints.end()) {
        return false;
    }
    Actuator::Command cmd;
    cmd.timestamp = physics.getSimulationTime();
    cmd.targetValue = it->second.range.clamp(degrees) * kDegToRad;
    it->second.motor->applyCommand(cmd);
    return true;
}

bool BipedRobot::hasJoint(const std::string& name) const {
    return joints.count(name) > 0;
}

std::map<std::string, JointState> BipedRobot::getJointStates() const {
    std::map<std::string, JointState> states;
    for (const auto& [name, joint] : joints) {
        JointState s;
        s.angle = joint.motor->getCurrentPosition() * kRadToDeg;
        s.velocity = joint.motor->getCurrentVelocity() * kRadToDeg;
        states[name] = s;
    }
    return states;
}

Vec3 BipedRobot::getPelvisPosition() const {
    dVector3 p;
    dBodyGetRelPointPos(torso, 0.0, 0.0, -config.torsoSize.z * 0.5, p);
    return Vec3{p[0], p[1], p[2]};
}

dGeomID BipedRobot::getFootGeom(LegSide side) const {
    switch (side) {
        case LegSide::LEFT: return leftFoot;
        case LegSide::RIGHT: return rightFoot;
        case LegSide::NONE: break;
    }
    return nullptr;
}
