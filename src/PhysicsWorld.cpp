#include "PhysicsWorld.h"
#include "DebugOutput.h"

#include <sstream>
#include <utility>

using BalanceControl::Vec3;

PhysicsWorld::PhysicsWorld(double gravity) {
    world = dWorldCreate();
    space = dHashSpaceCreate(0);
    contactGroup = dJointGroupCreate(0);

    // Z-up
    dWorldSetGravity(world, 0, 0, gravity);
    dWorldSetERP(world, 0.8);  // Stiffer joints for a small robot
    dWorldSetCFM(world, 1e-6);
    dWorldSetContactMaxCorrectingVel(world, 1.0);
    dWorldSetContactSurfaceLayer(world, 0.0005);
    dWorldSetAutoDisableFlag(world, 0);
    dWorldSetQuickStepNumIterations(world, 50);

    // A box is more reliable than an infinite plane; top face at Z=0
    groundBox = dCreateBox(space, 100.0, 100.0, 1.0);
    dGeomSetPosition(groundBox, 0, 0, -0.5);

    DEBUG_INFO("[PhysicsWorld] Created ground box at Z=0 (100x100x1m)");
}

PhysicsWorld::~PhysicsWorld() {
    // Contact joints first, then the space (destroys its geoms), then the
    // world (destroys bodies and the remaining joints)
    if (contactGroup) {
        dJointGroupEmpty(contactGroup);
        dJointGroupDestroy(contactGroup);
        contactGroup = nullptr;
    }
    if (space) {
        dSpaceDestroy(space);
        space = nullptr;
        groundBox = nullptr;
    }
    if (world) {
        dWorldDestroy(world);
        world = nullptr;
    }
    objects.clear();
}

void PhysicsWorld::nearCallback(void* data, dGeomID o1, dGeomID o2) {
    PhysicsWorld* pw = static_cast<PhysicsWorld*>(data);
    pw->handleCollision(o1, o2);
}

void PhysicsWorld::handleCollision(dGeomID o1, dGeomID o2) {
    dBodyID b1 = dGeomGetBody(o1);
    dBodyID b2 = dGeomGetBody(o2);

    // Only body/ground pairs; the robot does not collide with itself
    if (b1 && b2) {
        return;
    }
    if (!b1 && !b2) {
        return;
    }

    dContact contact[MAX_CONTACTS];
    int numContacts = dCollide(o1, o2, MAX_CONTACTS, &contact[0].geom, sizeof(dContact));

    for (int i = 0; i < numContacts; ++i) {
        contact[i].surface.mode = dContactSoftCFM | dContactSoftERP | dContactApprox1;
        contact[i].surface.mu = groundFriction;
        contact[i].surface.soft_erp = contactERP;
        contact[i].surface.soft_cfm = contactCFM;

        dJointID c = dJointCreateContact(world, contactGroup, &contact[i]);
        dJointAttach(c, b1, b2);

        const dContactGeom& g = contact[i].geom;
        ContactPoint cp;
        cp.position = Vec3{g.pos[0], g.pos[1], g.pos[2]};
        cp.normal = Vec3{g.normal[0], g.normal[1], g.normal[2]};
        cp.depth = g.depth;
        cp.geom1 = g.g1;
        cp.geom2 = g.g2;
        activeContacts.push_back(cp);
    }

    if (numContacts > 0 && Debug::shouldPrint(Debug::ALL)) {
        std::ostringstream oss;
        oss << "Contact class=" << dGeomGetClass(b1 ? o1 : o2) << " points=" << numContacts;
        DEBUG_PHYSICS(oss.str());
    }
}

void PhysicsWorld::step(double deltaTime) {
    activeContacts.clear();
    dSpaceCollide(space, this, &PhysicsWorld::nearCallback);
    dWorldQuickStep(world, deltaTime);
    dJointGroupEmpty(contactGroup);

    simulationTime += deltaTime;
    ++stepCount;
}

void PhysicsWorld::setGravity(double gz) {
    dWorldSetGravity(world, 0, 0, gz);
}

dBodyID PhysicsWorld::createBox(const Vec3& position, const Vec3& size, double mass) {
    dBodyID body = dBodyCreate(world);

    dMass m;
    dMassSetBoxTotal(&m, mass, size.x, size.y, size.z);
    dBodySetMass(body, &m);

    dGeomID geom = dCreateBox(space, size.x, size.y, size.z);
    dGeomSetBody(geom, body);
    dBodySetPosition(body, position.x, position.y, position.z);

    PhysicsObject obj;
    obj.body = body;
    obj.geom = geom;
    objects.push_back(obj);
    return body;
}

dBodyID PhysicsWorld::createSphere(const Vec3& position, double radius, double mass) {
    dBodyID body = dBodyCreate(world);

    dMass m;
    dMassSetSphereTotal(&m, mass, radius);
    dBodySetMass(body, &m);

    dGeomID geom = dCreateSphere(space, radius);
    dGeomSetBody(geom, body);
    dBodySetPosition(body, position.x, position.y, position.z);

    PhysicsObject obj;
    obj.body = body;
    obj.geom = geom;
    objects.push_back(obj);
    return body;
}

dBodyID PhysicsWorld::createCapsule(const Vec3& position, double radius, double length, double mass) {
    dBodyID body = dBodyCreate(world);

    dMass m;
    dMassSetCapsuleTotal(&m, mass, 3, radius, length);  // direction 3 = z
    dBodySetMass(body, &m);

    dGeomID geom = dCreateCapsule(space, radius, length);
    dGeomSetBody(geom, body);
    dBodySetPosition(body, position.x, position.y, position.z);

    PhysicsObject obj;
    obj.body = body;
    obj.geom = geom;
    objects.push_back(obj);
    return body;
}

std::vector<PhysicsWorld::ContactPoint> PhysicsWorld::getContactPoints(dGeomID geom) const {
    std::vector<ContactPoint> result;
    for (const auto& c : activeContacts) {
        if (c.geom1 == geom) {
            result.push_back(c);
        } else if (c.geom2 == geom) {
            ContactPoint flipped = c;
            flipped.normal = Vec3{-c.normal.x, -c.normal.y, -c.normal.z};
            std::swap(flipped.geom1, flipped.geom2);
            result.push_back(flipped);
        }
    }
    return result;
}

dGeomID PhysicsWorld::getGeom(dBodyID body) const {
    for (const auto& obj : objects) {
        if (obj.body == body) return obj.geom;
    }
    return nullptr;
}
