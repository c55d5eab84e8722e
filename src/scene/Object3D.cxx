#include "scene/Object3D.hxx"

#include <algorithm>
#include <stdexcept>

namespace scene {

Object3D &Object3D::add(std::unique_ptr<Object3D> child) {
    if (!child) {
        throw std::invalid_argument("Object3D::add: null child");
    }
    if (child.get() == this || child->parent_) {
        throw std::invalid_argument("Object3D::add: node already has a parent");
    }
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

std::unique_ptr<Object3D> Object3D::remove(Object3D *child) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [child](const std::unique_ptr<Object3D> &c) { return c.get() == child; });
    if (it == children_.end()) return nullptr;

    std::unique_ptr<Object3D> out = std::move(*it);
    children_.erase(it);
    out->parent_ = nullptr;
    return out;
}

void Object3D::clear() {
    for (auto &c : children_) {
        c->parent_ = nullptr;
    }
    children_.clear();
}

Eigen::Affine3d Object3D::localTransform() const {
    Eigen::Affine3d t = Eigen::Affine3d::Identity();
    t.translate(position);
    t.rotate(quaternion.normalized());
    return t;
}

Eigen::Affine3d Object3D::worldTransform() const {
    Eigen::Affine3d t = localTransform();
    for (const Object3D *p = parent_; p; p = p->parent_) {
        t = p->localTransform() * t;
    }
    return t;
}

void Object3D::traverse(const std::function<void(const Object3D &)> &fn) const {
    fn(*this);
    for (const auto &c : children_) {
        c->traverse(fn);
    }
}

Box3 computeBoundingBox(const Object3D &object) {
    Box3 box;
    object.traverse([&box](const Object3D &node) {
        if (node.kind() != Object3D::Kind::Mesh) return;
        const auto &mesh = static_cast<const MeshNode &>(node);
        if (!mesh.geometry) return;

        Eigen::Affine3d world = node.worldTransform();
        for (const auto &p : mesh.geometry->positions) {
            box.extend(world * p);
        }
    });
    return box;
}

} // namespace scene
