#include "SimulationEnvironment.h"
#include "DebugOutput.h"

#include <cmath>
#include <sstream>

using namespace BalanceControl;

namespace {

Vec3 toVec3(const dReal* v) {
    return Vec3{v[0], v[1], v[2]};
}

Vec3 worldToBody(dBodyID body, const Vec3& v) {
    dVector3 out;
    dBodyVectorFromWorld(body, v.x, v.y, v.z, out);
    return Vec3{out[0], out[1], out[2]};
}

} // namespace

SimulationEnvironment::SimulationEnvironment(const SimulationConfig& sim, const JointRanges& ranges)
    : config(sim), ranges(ranges), noise(sim.noiseSeed) {
    config.validate();
    noise.setNoiseLevel(config.imuNoiseLevel);
    build();
}

SimulationEnvironment::~SimulationEnvironment() {
    // Robot references the world
    robot.reset();
    physicsWorld.reset();
}

void SimulationEnvironment::build() {
    physicsWorld = std::make_unique<PhysicsWorld>(config.gravity);
    physicsWorld->setGroundFriction(config.groundFriction);
    robot = std::make_unique<BipedRobot>(*physicsWorld, ranges, config);

    time = 0.0;
    pushRemaining = 0.0;
    pushForce = Vec3{};
    previousVelocity = Vec3{};
    linearAcceleration = Vec3{};
}

void SimulationEnvironment::resetRobot() {
    robot.reset();
    physicsWorld.reset();
    build();
    DEBUG_INFO("[Simulation] Robot reset to spawn pose");
}

BaseState SimulationEnvironment::getBaseState() const {
    dBodyID torso = robot->getTorso();
    const dReal* q = dBodyGetQuaternion(torso);

    BaseState base;
    base.position = robot->getPelvisPosition();
    base.quaternion = Quaternion{q[0], q[1], q[2], q[3]};
    base.orientation = quaternionToEuler(base.quaternion);
    base.linearVelocity = toVec3(dBodyGetLinearVel(torso));
    base.angularVelocity = toVec3(dBodyGetAngularVel(torso));
    return base;
}

std::map<std::string, JointState> SimulationEnvironment::getJointStates() const {
    return robot->getJointStates();
}

ImuReading SimulationEnvironment::getImuData() {
    dBodyID torso = robot->getTorso();
    BaseState base = getBaseState();

    // Specific force: what an accelerometer at rest reads as +g upwards
    Vec3 specific{linearAcceleration.x, linearAcceleration.y, linearAcceleration.z - config.gravity};

    ImuReading imu;
    imu.orientation = base.orientation;
    imu.angularVelocity = worldToBody(torso, base.angularVelocity);
    imu.linearAcceleration = worldToBody(torso, specific);
    noise.applyIMUNoise(imu);
    return imu;
}

RobotState SimulationEnvironment::getRobotState() {
    RobotState state;
    state.timestamp = time;
    state.base = getBaseState();
    state.joints = getJointStates();
    state.imu = getImuData();
    return state;
}

void SimulationEnvironment::setJointPositions(const ControlCommand& command) {
    for (const auto& [joint, angle] : command) {
        if (!robot->setJointTarget(joint, angle)) {
            DEBUG_WARNING("[Simulation] Ignoring command for unknown joint '" + joint + "'");
        }
    }
}

void SimulationEnvironment::step() {
    const double dt = config.timeStep;

    if (pushRemaining > 0.0) {
        dBodyAddForce(robot->getTorso(), pushForce.x, pushForce.y, pushForce.z);
        pushRemaining -= dt;
    }

    robot->updateMotors(dt);
    physicsWorld->step(dt);
    time += dt;

    Vec3 v = toVec3(dBodyGetLinearVel(robot->getTorso()));
    linearAcceleration = Vec3{(v.x - previousVelocity.x) / dt,
                              (v.y - previousVelocity.y) / dt,
                              (v.z - previousVelocity.z) / dt};
    previousVelocity = v;
}

void SimulationEnvironment::stepFor(double seconds) {
    int steps = static_cast<int>(std::lround(seconds / config.timeStep));
    for (int i = 0; i < steps; ++i) {
        step();
    }
}

void SimulationEnvironment::applyExternalForce(const Vec3& force, double duration) {
    pushForce = force;
    pushRemaining = duration;

    std::ostringstream oss;
    oss << "[Simulation] Push (" << force.x << ", " << force.y << ", " << force.z
        << ") N for " << duration << " s at t=" << time;
    DEBUG_INFO(oss.str());
}

SimulationEnvironment::FootContacts SimulationEnvironment::getFootContacts() const {
    FootContacts contacts;
    contacts.left = !physicsWorld->getContactPoints(robot->getFootGeom(LegSide::LEFT)).empty();
    contacts.right = !physicsWorld->getContactPoints(robot->getFootGeom(LegSide::RIGHT)).empty();
    return contacts;
}
