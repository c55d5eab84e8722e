#ifndef __OBJECT3D_HXX__
#define __OBJECT3D_HXX__

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "Geometry.hxx"
#include "Material.hxx"

namespace scene {

// Node of the scene graph. A node owns its children; `parent` is a
// non-owning back pointer maintained by add()/remove().
class Object3D {
 public:
    enum class Kind { Group, Scene, Mesh, AmbientLight, PointLight, Camera };

    std::string name;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    Eigen::Quaterniond quaternion = Eigen::Quaterniond::Identity();
    bool visible = true;

    explicit Object3D(Kind kind) : kind_(kind) {}
    virtual ~Object3D() = default;

    Object3D(const Object3D &) = delete;
    Object3D &operator=(const Object3D &) = delete;

    Kind kind() const { return kind_; }

    Object3D *parent() const { return parent_; }
    const std::vector<std::unique_ptr<Object3D>> &children() const { return children_; }

    // Takes ownership of `child`. Throws std::invalid_argument for null or parented nodes.
    Object3D &add(std::unique_ptr<Object3D> child);

    // Detaches `child` and hands ownership back; nullptr when it is not a direct child.
    std::unique_ptr<Object3D> remove(Object3D *child);

    void clear();

    Eigen::Affine3d localTransform() const;
    Eigen::Affine3d worldTransform() const;

    // Pre-order walk over this node and its descendants.
    void traverse(const std::function<void(const Object3D &)> &fn) const;

 private:
    Kind kind_;
    Object3D *parent_ = nullptr;
    std::vector<std::unique_ptr<Object3D>> children_;
};

class Group : public Object3D {
 public:
    Group() : Object3D(Kind::Group) {}
};

class Scene : public Object3D {
 public:
    Scene() : Object3D(Kind::Scene) {}
};

class MeshNode : public Object3D {
 public:
    MeshNode(std::shared_ptr<const Geometry> geometry, std::shared_ptr<const Material> material)
        : Object3D(Kind::Mesh), geometry(std::move(geometry)), material(std::move(material)) {}

    std::shared_ptr<const Geometry> geometry;
    std::shared_ptr<const Material> material;
};

class AmbientLight : public Object3D {
 public:
    AmbientLight(unsigned int hex, float intensity)
        : Object3D(Kind::AmbientLight), color(colorFromHex(hex)), intensity(intensity) {}

    Color color;
    float intensity;
};

class PointLight : public Object3D {
 public:
    PointLight(unsigned int hex, float intensity)
        : Object3D(Kind::PointLight), color(colorFromHex(hex)), intensity(intensity) {}

    Color color;
    float intensity;
};

// World-space axis aligned box of every mesh vertex under `object`.
// Empty when the subtree holds no geometry.
Box3 computeBoundingBox(const Object3D &object);

} // namespace scene

#endif // __OBJECT3D_HXX__
