#pragma once

#include "Actuator.h"
#include "BalanceConfig.h"
#include "BalanceTypes.h"
#include "JointLayout.h"
#include "PhysicsWorld.h"

#include <ode/ode.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

// Procedurally built 9-DOF biped: torso, head on a pitch joint and two legs
// of hip roll, hip pitch, knee and ankle pitch.
//
// Frame: x forward, y left, z up. Spawned upright with straight legs, which
// is the zero angle of every joint. Joint angle conventions (degrees at the
// public interface):
//   hip_roll     positive = adduction, leg swings towards the midline (mirrored per side)
//   hip_pitch    positive = flexion, knee moves forward
//   knee         positive = flexion, foot moves backward
//   ankle_pitch  positive = toes down
//   head_pitch   positive = nod forward
// With the torso upright and the feet flat, hip - knee - ankle = 0.
class BipedRobot {
public:
    enum class Shape { BOX, CAPSULE, SPHERE };

    struct Link {
        std::string name;
        dBodyID body;
        dGeomID geom;
        Shape shape;
        BalanceControl::Vec3 size;  // box: full extents; capsule: (radius, radius, length); sphere: (radius, ...)
    };

    struct Joint {
        std::string name;
        dJointID joint;
        std::unique_ptr<PositionMotor> motor;
        BalanceControl::JointRange range;  // degrees
    };

    struct Config {
        BalanceControl::Vec3 torsoSize{0.08, 0.14, 0.16};
        double torsoMass = 1.0;
        double headRadius = 0.04;
        double headMass = 0.2;

        double hipOffsetY = 0.05;      // lateral distance of each hip from the midline
        double hipLinkSize = 0.03;
        double hipLinkMass = 0.05;
        double thighLength = 0.107;    // hip pitch axis to knee axis
        double calfLength = 0.107;     // knee axis to ankle axis
        double legRadius = 0.015;
        double thighMass = 0.15;
        double calfMass = 0.12;

        BalanceControl::Vec3 footSize{0.10, 0.06, 0.02};
        double footMass = 0.08;
        double ankleHeight = 0.03;     // ankle axis above the sole

        double spawnClearance = 0.002;
    };

    BipedRobot(PhysicsWorld& world, const BalanceControl::JointRanges& ranges,
               const BalanceControl::SimulationConfig& sim, const Config& config = Config{});

    // Bodies and joints belong to the ODE world and go away with it
    ~BipedRobot() = default;

    BipedRobot(const BipedRobot&) = delete;
    BipedRobot& operator=(const BipedRobot&) = delete;

    // Runs every position servo, once per physics step
    void updateMotors(double deltaTime);

    // Target in degrees, clamped to the joint range. Returns false for unknown joints.
    bool setJointTarget(const std::string& name, double degrees);
    bool hasJoint(const std::string& name) const;

    std::map<std::string, BalanceControl::JointState> getJointStates() const;

    // Midpoint between the hips on the underside of the torso
    BalanceControl::Vec3 getPelvisPosition() const;
    // Pelvis height with straight legs, used to place the torso at spawn
    double standingHeight() const;

    dBodyID getTorso() const { return torso; }
    dGeomID getFootGeom(BalanceControl::LegSide side) const;
    const std::vector<Link>& getLinks() const { return links; }
    const Config& getConfig() const { return config; }

private:
    void createBody();
    void createLeg(BalanceControl::LegSide side);
    dBodyID addLink(const std::string& name, Shape shape, const BalanceControl::Vec3& position,
                    const BalanceControl::Vec3& size, double mass);
    void addJoint(const std::string& name, dBodyID parent, dBodyID child,
                  const BalanceControl::Vec3& anchor, const BalanceControl::Vec3& axis);

    PhysicsWorld& physics;
    BalanceControl::JointRanges ranges;
    BalanceControl::SimulationConfig simConfig;
    Config config;

    dBodyID torso = nullptr;
    dGeomID leftFoot = nullptr;
    dGeomID rightFoot = nullptr;

    std::vector<Link> links;
    std::map<std::string, Joint> joints;
};
