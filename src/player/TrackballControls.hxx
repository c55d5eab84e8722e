#pragma once

#include <limits>

#include <Eigen/Dense>

#include "player/Config.hxx"
#include "player/Container.hxx"

#include "scene/Camera.hxx"

namespace player {

// Trackball camera controller: primary drag rotates around `target`, middle
// drag or the wheel zooms, secondary drag pans. Motion is applied by update()
// and, unless staticMoving, decays by dynamicDampingFactor per update.
//
// Registers itself as an input listener on `container` for its lifetime.
class TrackballControls : public InputListener {
 public:
    enum class State { None = -1, Rotate = 0, Zoom = 1, Pan = 2 };

    double rotateSpeed = 1.0;
    double zoomSpeed = 1.2;
    double panSpeed = 0.3;

    bool noRotate = false;
    bool noZoom = false;
    bool noPan = false;

    bool staticMoving = false;
    double dynamicDampingFactor = 0.2;

    double minDistance = 0.0;
    double maxDistance = std::numeric_limits<double>::infinity();

    bool enabled = true;

    Eigen::Vector3d target = Eigen::Vector3d::Zero();

    // Captures the camera's position, up vector and `target` as the reset state.
    TrackballControls(scene::PerspectiveCamera &camera, Container *container);
    ~TrackballControls() override;

    TrackballControls(const TrackballControls &) = delete;
    TrackballControls &operator=(const TrackballControls &) = delete;

    void configure(const ControlsConfig &config);

    // Re-read the container size used to normalize pointer coordinates.
    void handleResize();

    void update();
    void reset();

    State state() const { return state_; }

    void onPointerDown(PointerButton button, double x, double y) override;
    void onPointerMove(double x, double y) override;
    void onPointerUp(PointerButton button) override;
    void onWheel(double delta) override;

 private:
    scene::PerspectiveCamera &camera_;
    Container *container_;

    double screenWidth_ = 1.0;
    double screenHeight_ = 1.0;

    State state_ = State::None;

    Eigen::Vector3d eye_ = Eigen::Vector3d::Zero();
    Eigen::Vector3d lastAxis_ = Eigen::Vector3d::UnitY();
    double lastAngle_ = 0.0;

    Eigen::Vector2d movePrev_ = Eigen::Vector2d::Zero();
    Eigen::Vector2d moveCurr_ = Eigen::Vector2d::Zero();
    Eigen::Vector2d zoomStart_ = Eigen::Vector2d::Zero();
    Eigen::Vector2d zoomEnd_ = Eigen::Vector2d::Zero();
    Eigen::Vector2d panStart_ = Eigen::Vector2d::Zero();
    Eigen::Vector2d panEnd_ = Eigen::Vector2d::Zero();

    Eigen::Vector3d target0_;
    Eigen::Vector3d position0_;
    Eigen::Vector3d up0_;

    Eigen::Vector2d mouseOnScreen(double x, double y) const;
    Eigen::Vector2d mouseOnCircle(double x, double y) const;

    void rotateCamera();
    void zoomCamera();
    void panCamera();
    void checkDistances();
};

} // namespace player
