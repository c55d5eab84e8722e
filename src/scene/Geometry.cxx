#include "scene/Geometry.hxx"

#include <cmath>

namespace scene {

void Geometry::computeVertexNormals() {
    normals.assign(positions.size(), Point::Zero());

    for (const auto &t : triangles) {
        const Point &a = positions[t[0]];
        const Point &b = positions[t[1]];
        const Point &c = positions[t[2]];
        Point n = (b - a).cross(c - a);
        double len = n.norm();
        if (len < 1e-12) continue; // degenerate
        n /= len;
        for (int k = 0; k < 3; ++k) {
            normals[t[k]] += n;
        }
    }

    for (auto &n : normals) {
        double len = n.norm();
        if (len > 1e-12) {
            n /= len;
        } else {
            n = Point(0.0, 0.0, 1.0);
        }
    }
}

Box3 Geometry::boundingBox() const {
    Box3 b; // default constructed box is empty
    for (const auto &p : positions) {
        b.extend(p);
    }
    return b;
}

} // namespace scene
