#pragma once

#include "BalanceTypes.h"

#include <ode/ode.h>

#include <vector>

// Scoped ODE library initialisation. Create one before any PhysicsWorld and
// keep it alive until every world is destroyed.
class OdeSession {
public:
    OdeSession() {
        dInitODE2(0);
        dAllocateODEDataForThread(dAllocateMaskAll);
    }
    ~OdeSession() {
        dCloseODE();
    }
    OdeSession(const OdeSession&) = delete;
    OdeSession& operator=(const OdeSession&) = delete;
};

class PhysicsWorld {
public:
    struct ContactPoint {
        BalanceControl::Vec3 position;
        BalanceControl::Vec3 normal;   // as reported by dCollide, pointing into geom1
        double depth;
        dGeomID geom1;
        dGeomID geom2;
    };

    struct PhysicsObject {
        dBodyID body;
        dGeomID geom;

        PhysicsObject() : body(nullptr), geom(nullptr) {}
    };

    explicit PhysicsWorld(double gravity = -9.81);
    ~PhysicsWorld();

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // One fixed step: collide, integrate, drop contact joints
    void step(double deltaTime);

    void setGravity(double gz);
    void setGroundFriction(double friction) { groundFriction = friction; }

    // Dynamic bodies with a matching collision geom, positioned in world coordinates.
    // Capsules are aligned with the body z axis; length excludes the end caps.
    dBodyID createBox(const BalanceControl::Vec3& position, const BalanceControl::Vec3& size, double mass);
    dBodyID createSphere(const BalanceControl::Vec3& position, double radius, double mass);
    dBodyID createCapsule(const BalanceControl::Vec3& position, double radius, double length, double mass);

    // Contacts from the last step involving geom, reordered so geom1 == geom
    std::vector<ContactPoint> getContactPoints(dGeomID geom) const;
    const std::vector<ContactPoint>& getActiveContacts() const { return activeContacts; }

    dGeomID getGeom(dBodyID body) const;

    dWorldID getWorld() const { return world; }
    dSpaceID getSpace() const { return space; }
    dGeomID getGround() const { return groundBox; }
    double getSimulationTime() const { return simulationTime; }
    int getStepCount() const { return stepCount; }

private:
    static void nearCallback(void* data, dGeomID o1, dGeomID o2);
    void handleCollision(dGeomID o1, dGeomID o2);

    dWorldID world;
    dSpaceID space;
    dJointGroupID contactGroup;
    dGeomID groundBox;

    double groundFriction = 1.0;
    double contactERP = 0.8;
    double contactCFM = 1e-5;
    static constexpr int MAX_CONTACTS = 8;

    std::vector<PhysicsObject> objects;
    std::vector<ContactPoint> activeContacts;

    double simulationTime = 0.0;
    int stepCount = 0;
};
