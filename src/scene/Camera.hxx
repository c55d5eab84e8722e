#ifndef __CAMERA_HXX__
#define __CAMERA_HXX__

#include <Eigen/Dense>

#include "Object3D.hxx"

namespace scene {

// Perspective camera looking down its local -Z axis.
class PerspectiveCamera : public Object3D {
 public:
    double fov;    // vertical field of view, degrees
    double aspect;
    double near;
    double far;
    Eigen::Vector3d up = Eigen::Vector3d::UnitY();

    PerspectiveCamera(double fov, double aspect, double near, double far);

    // Orients the camera so that -Z points at `target` (world space), keeping `up` upright.
    void lookAt(const Eigen::Vector3d &target);

    // Must be called after changing fov, aspect, near or far.
    void updateProjectionMatrix();

    const Eigen::Matrix4d &projectionMatrix() const { return projection_; }

    // Inverse of the camera's world transform.
    Eigen::Matrix4d viewMatrix() const;

 private:
    Eigen::Matrix4d projection_;
};

} // namespace scene

#endif // __CAMERA_HXX__
