#ifndef __GEOMETRY_HXX__
#define __GEOMETRY_HXX__

#include <array>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace scene {

typedef Eigen::Vector3d Point;
typedef Eigen::Vector2d TexCoord;
typedef std::array<int, 3> Triangle;

typedef Eigen::AlignedBox3d Box3;

// Indexed triangle soup. Normals and uvs, when present, are per vertex and
// share the position indexing.
class Geometry {
 public:
    std::vector<Point> positions;
    std::vector<Point> normals;
    std::vector<TexCoord> uvs;
    std::vector<Triangle> triangles;

    bool empty() const { return triangles.empty(); }

    // Flat normals: each triangle's unit normal accumulated onto its vertices.
    void computeVertexNormals();

    Box3 boundingBox() const;
};

} // namespace scene

#endif // __GEOMETRY_HXX__
