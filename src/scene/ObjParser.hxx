#ifndef __OBJPARSER_HXX__
#define __OBJPARSER_HXX__

#include <array>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "Geometry.hxx"
#include "Material.hxx"
#include "Object3D.hxx"
#include "ParseError.hxx"

namespace scene {

// One face corner. Indices are resolved to 0-based; -1 marks an absent attribute.
struct ObjIndex {
    int v = -1;
    int vt = -1;
    int vn = -1;

    bool operator==(const ObjIndex &o) const { return v == o.v && vt == o.vt && vn == o.vn; }
};

struct ObjIndexHash {
    std::size_t operator()(const ObjIndex &k) const {
        return static_cast<std::size_t>(k.v) * 73856093u ^ static_cast<std::size_t>(k.vt) * 19349663u ^
               static_cast<std::size_t>(k.vn) * 83492791u;
    }
};

typedef std::array<ObjIndex, 3> ObjTriangle;

// Faces sharing an object name and a material.
struct ObjGroup {
    std::string object;
    std::string material;
    std::vector<ObjTriangle> faces;
};

struct ObjModel {
    std::vector<Point> positions;
    std::vector<Point> normals;
    std::vector<TexCoord> uvs;
    std::vector<ObjGroup> groups;             // groups without faces are dropped
    std::vector<std::string> materialLibraries; // `mtllib` arguments, in file order
};

// Parse Wavefront OBJ text. `source` only names the input in error messages.
// Polygons are fan-triangulated; negative indices count back from the last element.
ObjModel parseObj(std::istream &in, const std::string &source);

// Build a Group with one MeshNode per face group. Materials are taken from
// `materials` when given (unknown names fall back to the default material).
std::unique_ptr<Group> buildObject(const ObjModel &model, MaterialSet *materials);

} // namespace scene

#endif // __OBJPARSER_HXX__
