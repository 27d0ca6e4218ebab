#pragma once

#include "BipedRobot.h"

#include <vsg/all.h>
#include <vsgXchange/all.h>

#include <cstdint>
#include <vector>

// Optional window onto the simulation. Builds one node per robot link and
// copies the ODE body poses into their transforms before each frame.
class Visualizer {
public:
    Visualizer(uint32_t width = 1280, uint32_t height = 720);
    ~Visualizer() = default;

    // Returns false when no window could be created
    bool initialize(const BipedRobot& robot);

    // Copies every body pose from the physics world into the scene graph
    void syncFromPhysics();

    // Draws one frame; returns false once the window has been closed
    bool render();

    bool shouldClose() const;
    void close();

    // Keeps the camera aimed at the given point (the pelvis, usually)
    void setCameraTarget(const BalanceControl::Vec3& target);

private:
    struct LinkNode {
        dBodyID body;
        vsg::ref_ptr<vsg::MatrixTransform> transform;
    };

    vsg::ref_ptr<vsg::Group> createScene(const BipedRobot& robot, vsg::ref_ptr<vsg::Options> options);
    vsg::ref_ptr<vsg::Node> createLinkGeometry(vsg::Builder& builder, const BipedRobot::Link& link);

    uint32_t windowWidth;
    uint32_t windowHeight;

    vsg::ref_ptr<vsg::Window> window;
    vsg::ref_ptr<vsg::Viewer> viewer;
    vsg::ref_ptr<vsg::Group> sceneRoot;
    vsg::ref_ptr<vsg::Camera> camera;
    vsg::ref_ptr<vsg::LookAt> lookAt;

    std::vector<LinkNode> linkNodes;
};
