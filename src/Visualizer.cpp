#include "Visualizer.h"
#include "DebugOutput.h"

#include <vsg/io/Options.h>
#include <vsg/nodes/MatrixTransform.h>
#include <vsg/utils/Builder.h>
#include <vsg/utils/ShaderSet.h>

#include <sstream>

namespace {

vsg::vec4 linkColor(const std::string& name) {
    if (name == "torso") return vsg::vec4(0.3f, 0.3f, 0.8f, 1.0f);
    if (name == "head") return vsg::vec4(0.8f, 0.8f, 0.85f, 1.0f);
    if (name.find("foot") != std::string::npos) return vsg::vec4(0.8f, 0.2f, 0.2f, 1.0f);
    if (name.find("hip") != std::string::npos) return vsg::vec4(0.15f, 0.15f, 0.15f, 1.0f);
    return vsg::vec4(0.25f, 0.25f, 0.25f, 1.0f);
}

} // namespace

Visualizer::Visualizer(uint32_t width, uint32_t height)
    : windowWidth(width), windowHeight(height) {
}

bool Visualizer::initialize(const BipedRobot& robot) {
    try {
        auto options = vsg::Options::create();
        options->sharedObjects = vsg::SharedObjects::create();
        options->fileCache = vsg::getEnv("VSG_FILE_CACHE");
        options->paths = vsg::getEnvPaths("VSG_FILE_PATH");
        options->add(vsgXchange::all::create());

        auto windowTraits = vsg::WindowTraits::create();
        windowTraits->windowTitle = "Biped Balance";
        windowTraits->width = windowWidth;
        windowTraits->height = windowHeight;
        windowTraits->decoration = true;

        window = vsg::Window::create(windowTraits);
        if (!window) {
            DEBUG_ERROR("[Visualizer] Failed to create VSG window");
            return false;
        }

        viewer = vsg::Viewer::create();
        viewer->addWindow(window);

        sceneRoot = createScene(robot, options);
        syncFromPhysics();

        // Robot is about 0.4 m tall, frame it from the front-left
        BalanceControl::Vec3 pelvis = robot.getPelvisPosition();
        vsg::dvec3 centre(pelvis.x, pelvis.y, pelvis.z);
        lookAt = vsg::LookAt::create(centre + vsg::dvec3(0.9, 0.6, 0.35), centre, vsg::dvec3(0.0, 0.0, 1.0));

        auto perspective = vsg::Perspective::create(
            30.0,
            static_cast<double>(window->extent2D().width) / static_cast<double>(window->extent2D().height),
            0.01,
            50.0);

        camera = vsg::Camera::create(perspective, lookAt, vsg::ViewportState::create(window->extent2D()));

        viewer->addEventHandler(vsg::CloseHandler::create(viewer));
        viewer->addEventHandler(vsg::Trackball::create(camera));

        auto commandGraph = vsg::createCommandGraphForView(window, camera, sceneRoot);
        viewer->assignRecordAndSubmitTaskAndPresentation({commandGraph});
        viewer->compile();

        std::ostringstream oss;
        oss << "[Visualizer] Window " << window->extent2D().width << "x" << window->extent2D().height
            << " with " << linkNodes.size() << " links";
        DEBUG_INFO(oss.str());
        return true;
    } catch (const vsg::Exception& e) {
        DEBUG_ERROR("[Visualizer] VSG error: " + e.message);
        return false;
    } catch (const std::exception& e) {
        DEBUG_ERROR(std::string("[Visualizer] Failed to initialize: ") + e.what());
        return false;
    }
}

vsg::ref_ptr<vsg::Group> Visualizer::createScene(const BipedRobot& robot, vsg::ref_ptr<vsg::Options> options) {
    auto builder = vsg::Builder::create();
    builder->options = options;
    builder->shaderSet = vsg::createPhongShaderSet(options);

    auto scene = vsg::Group::create();

    vsg::GeometryInfo groundInfo;
    vsg::StateInfo stateInfo;
    stateInfo.lighting = true;

    // Ground quad at Z=0 to match the physics ground
    groundInfo.position.set(0.0f, 0.0f, 0.0f);
    groundInfo.dx.set(10.0f, 0.0f, 0.0f);
    groundInfo.dy.set(0.0f, 10.0f, 0.0f);
    groundInfo.color = vsg::vec4(0.7f, 0.7f, 0.7f, 1.0f);
    scene->addChild(builder->createQuad(groundInfo, stateInfo));

    linkNodes.clear();
    for (const auto& link : robot.getLinks()) {
        auto transform = vsg::MatrixTransform::create();
        transform->addChild(createLinkGeometry(*builder, link));
        scene->addChild(transform);
        linkNodes.push_back(LinkNode{link.body, transform});
    }

    return scene;
}

vsg::ref_ptr<vsg::Node> Visualizer::createLinkGeometry(vsg::Builder& builder, const BipedRobot::Link& link) {
    vsg::GeometryInfo geomInfo;
    vsg::StateInfo stateInfo;
    stateInfo.lighting = true;

    geomInfo.position.set(0.0f, 0.0f, 0.0f);
    geomInfo.color = linkColor(link.name);

    const float sx = static_cast<float>(link.size.x);
    const float sy = static_cast<float>(link.size.y);
    const float sz = static_cast<float>(link.size.z);

    switch (link.shape) {
        case BipedRobot::Shape::BOX:
            geomInfo.dx.set(sx, 0.0f, 0.0f);
            geomInfo.dy.set(0.0f, sy, 0.0f);
            geomInfo.dz.set(0.0f, 0.0f, sz);
            return builder.createBox(geomInfo, stateInfo);
        case BipedRobot::Shape::CAPSULE:
            // Capsule along Z: cylinder length plus both caps
            geomInfo.dx.set(2.0f * sx, 0.0f, 0.0f);
            geomInfo.dy.set(0.0f, 2.0f * sx, 0.0f);
            geomInfo.dz.set(0.0f, 0.0f, sz + 2.0f * sx);
            return builder.createCapsule(geomInfo, stateInfo);
        case BipedRobot::Shape::SPHERE:
            geomInfo.dx.set(2.0f * sx, 0.0f, 0.0f);
            geomInfo.dy.set(0.0f, 2.0f * sx, 0.0f);
            geomInfo.dz.set(0.0f, 0.0f, 2.0f * sx);
            return builder.createSphere(geomInfo, stateInfo);
    }
    return builder.createBox(geomInfo, stateInfo);
}

void Visualizer::syncFromPhysics() {
    for (auto& node : linkNodes) {
        const dReal* pos = dBodyGetPosition(node.body);
        const dReal* q = dBodyGetQuaternion(node.body);

        // ODE stores (w, x, y, z), VSG (x, y, z, w)
        vsg::dquat rotation(q[1], q[2], q[3], q[0]);
        node.transform->matrix = vsg::translate(vsg::dvec3(pos[0], pos[1], pos[2])) * vsg::rotate(rotation);
    }
}

bool Visualizer::render() {
    if (!viewer || !viewer->advanceToNextFrame()) {
        return false;
    }

    viewer->handleEvents();
    viewer->update();
    viewer->recordAndSubmit();
    viewer->present();
    return viewer->active();
}

bool Visualizer::shouldClose() const {
    return !viewer || !viewer->active();
}

void Visualizer::close() {
    if (viewer) {
        viewer->close();
    }
}

void Visualizer::setCameraTarget(const BalanceControl::Vec3& target) {
    if (!lookAt) {
        return;
    }
    vsg::dvec3 centre(target.x, target.y, target.z);
    vsg::dvec3 offset = lookAt->eye - lookAt->center;
    lookAt->center = centre;
    lookAt->eye = centre + offset;
}
