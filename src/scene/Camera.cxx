#include "scene/Camera.hxx"

#include <cmath>

namespace scene {

PerspectiveCamera::PerspectiveCamera(double fov, double aspect, double near, double far)
    : Object3D(Kind::Camera), fov(fov), aspect(aspect), near(near), far(far) {
    updateProjectionMatrix();
}

void PerspectiveCamera::lookAt(const Eigen::Vector3d &target) {
    Eigen::Vector3d eye = worldTransform().translation();

    // Camera basis: z points away from the target.
    Eigen::Vector3d z = eye - target;
    if (z.squaredNorm() < 1e-24) {
        z = Eigen::Vector3d::UnitZ();
    }
    z.normalize();

    Eigen::Vector3d x = up.cross(z);
    if (x.squaredNorm() < 1e-24) {
        // up is parallel to the view direction; nudge z to get a usable basis
        Eigen::Vector3d zz = z;
        if (std::fabs(up.z()) > 0.9999) {
            zz.x() += 1e-4;
        } else {
            zz.z() += 1e-4;
        }
        zz.normalize();
        x = up.cross(zz);
    }
    x.normalize();
    Eigen::Vector3d y = z.cross(x);

    Eigen::Matrix3d world;
    world.col(0) = x;
    world.col(1) = y;
    world.col(2) = z;

    // Express the rotation relative to the parent frame.
    Eigen::Quaterniond worldRotation(world);
    if (parent()) {
        Eigen::Quaterniond parentRotation(parent()->worldTransform().rotation());
        quaternion = parentRotation.inverse() * worldRotation;
    } else {
        quaternion = worldRotation;
    }
    quaternion.normalize();
}

void PerspectiveCamera::updateProjectionMatrix() {
    const double f = 1.0 / std::tan(0.5 * fov * M_PI / 180.0);

    projection_.setZero();
    projection_(0, 0) = f / aspect;
    projection_(1, 1) = f;
    projection_(2, 2) = (far + near) / (near - far);
    projection_(2, 3) = 2.0 * far * near / (near - far);
    projection_(3, 2) = -1.0;
}

Eigen::Matrix4d PerspectiveCamera::viewMatrix() const {
    return worldTransform().inverse(Eigen::Isometry).matrix();
}

} // namespace scene
