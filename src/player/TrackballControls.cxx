#include "player/TrackballControls.hxx"

#include <algorithm>
#include <cmath>

namespace player {

// Vector with the direction of `v` and signed length `len`.
static Eigen::Vector3d withLength(const Eigen::Vector3d &v, double len) {
    double n = v.norm();
    if (n < 1e-12) return Eigen::Vector3d::Zero();
    return v * (len / n);
}

TrackballControls::TrackballControls(scene::PerspectiveCamera &camera, Container *container)
    : camera_(camera), container_(container) {
    target0_ = target;
    position0_ = camera_.position;
    up0_ = camera_.up;

    if (container_) {
        container_->addInputListener(this);
    }
    handleResize();
}

TrackballControls::~TrackballControls() {
    if (container_) {
        container_->removeInputListener(this);
    }
}

void TrackballControls::configure(const ControlsConfig &config) {
    rotateSpeed = config.rotateSpeed;
    zoomSpeed = config.zoomSpeed;
    panSpeed = config.panSpeed;
    noZoom = config.noZoom;
    noPan = config.noPan;
    staticMoving = config.staticMoving;
    dynamicDampingFactor = config.dynamicDampingFactor;
}

void TrackballControls::handleResize() {
    if (!container_) return;
    screenWidth_ = std::max(1.0, container_->width());
    screenHeight_ = std::max(1.0, container_->height());
}

Eigen::Vector2d TrackballControls::mouseOnScreen(double x, double y) const {
    return Eigen::Vector2d(x / screenWidth_, y / screenHeight_);
}

Eigen::Vector2d TrackballControls::mouseOnCircle(double x, double y) const {
    return Eigen::Vector2d((x - 0.5 * screenWidth_) / (0.5 * screenWidth_),
                           (screenHeight_ - 2.0 * y) / screenWidth_);
}

void TrackballControls::rotateCamera() {
    Eigen::Vector2d delta = moveCurr_ - movePrev_;
    double angle = delta.norm();

    if (angle > 0.0) {
        eye_ = camera_.position - target;

        Eigen::Vector3d eyeDirection = eye_.normalized();
        Eigen::Vector3d upDirection = camera_.up.normalized();
        Eigen::Vector3d sideways = upDirection.cross(eyeDirection).normalized();

        Eigen::Vector3d moveDirection = withLength(upDirection, delta.y()) + withLength(sideways, delta.x());
        Eigen::Vector3d axis = moveDirection.cross(eye_);
        if (axis.norm() > 1e-12) {
            axis.normalize();
            angle *= rotateSpeed;
            Eigen::AngleAxisd q(angle, axis);
            eye_ = q * eye_;
            camera_.up = q * camera_.up;

            lastAxis_ = axis;
            lastAngle_ = angle;
        }
    } else if (!staticMoving && lastAngle_ != 0.0) {
        lastAngle_ *= std::sqrt(1.0 - dynamicDampingFactor);
        eye_ = camera_.position - target;
        Eigen::AngleAxisd q(lastAngle_, lastAxis_);
        eye_ = q * eye_;
        camera_.up = q * camera_.up;
    }

    movePrev_ = moveCurr_;
}

void TrackballControls::zoomCamera() {
    double factor = 1.0 + (zoomEnd_.y() - zoomStart_.y()) * zoomSpeed;
    if (factor != 1.0 && factor > 0.0) {
        eye_ *= factor;
    }

    if (staticMoving) {
        zoomStart_ = zoomEnd_;
    } else {
        zoomStart_.y() += (zoomEnd_.y() - zoomStart_.y()) * dynamicDampingFactor;
    }
}

void TrackballControls::panCamera() {
    Eigen::Vector2d change = panEnd_ - panStart_;
    if (change.squaredNorm() == 0.0) return;

    change *= eye_.norm() * panSpeed;
    Eigen::Vector3d pan = withLength(eye_.cross(camera_.up), change.x());
    pan += withLength(camera_.up, change.y());

    camera_.position += pan;
    target += pan;

    if (staticMoving) {
        panStart_ = panEnd_;
    } else {
        panStart_ += (panEnd_ - panStart_) * dynamicDampingFactor;
    }
}

void TrackballControls::checkDistances() {
    if (noZoom && noPan) return;

    if (eye_.squaredNorm() > maxDistance * maxDistance) {
        camera_.position = target + withLength(eye_, maxDistance);
        zoomStart_ = zoomEnd_;
    }
    if (eye_.squaredNorm() < minDistance * minDistance) {
        camera_.position = target + withLength(eye_, minDistance);
        zoomStart_ = zoomEnd_;
    }
}

void TrackballControls::update() {
    eye_ = camera_.position - target;

    if (!noRotate) rotateCamera();
    if (!noZoom) zoomCamera();
    if (!noPan) panCamera();

    camera_.position = target + eye_;
    checkDistances();
    camera_.lookAt(target);
}

void TrackballControls::reset() {
    state_ = State::None;
    lastAngle_ = 0.0;

    target = target0_;
    camera_.position = position0_;
    camera_.up = up0_;

    movePrev_ = moveCurr_;
    zoomStart_ = zoomEnd_;
    panStart_ = panEnd_;

    eye_ = camera_.position - target;
    camera_.lookAt(target);
}

void TrackballControls::onPointerDown(PointerButton button, double x, double y) {
    if (!enabled) return;
    if (state_ == State::None) {
        state_ = static_cast<State>(static_cast<int>(button));
    }

    if (state_ == State::Rotate && !noRotate) {
        moveCurr_ = mouseOnCircle(x, y);
        movePrev_ = moveCurr_;
    } else if (state_ == State::Zoom && !noZoom) {
        zoomStart_ = mouseOnScreen(x, y);
        zoomEnd_ = zoomStart_;
    } else if (state_ == State::Pan && !noPan) {
        panStart_ = mouseOnScreen(x, y);
        panEnd_ = panStart_;
    }
}

void TrackballControls::onPointerMove(double x, double y) {
    if (!enabled || state_ == State::None) return;

    if (state_ == State::Rotate && !noRotate) {
        movePrev_ = moveCurr_;
        moveCurr_ = mouseOnCircle(x, y);
    } else if (state_ == State::Zoom && !noZoom) {
        zoomEnd_ = mouseOnScreen(x, y);
    } else if (state_ == State::Pan && !noPan) {
        panEnd_ = mouseOnScreen(x, y);
    }
}

void TrackballControls::onPointerUp(PointerButton /*button*/) {
    if (!enabled) return;
    state_ = State::None;
}

void TrackballControls::onWheel(double delta) {
    if (!enabled || noZoom) return;
    // One wheel notch moves the zoom anchor by 0.01 screen heights; away from the user zooms in.
    zoomStart_.y() += delta * 0.01;
}

} // namespace player
