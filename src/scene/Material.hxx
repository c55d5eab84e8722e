#ifndef __MATERIAL_HXX__
#define __MATERIAL_HXX__

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace scene {

typedef Eigen::Vector3f Color;

// 0xRRGGBB -> linear [0,1] components
Color colorFromHex(unsigned int hex);

struct Texture {
    std::string path;       // resolved against the material library directory
    bool available = false; // file found during preload
};

class Material {
 public:
    std::string name;
    Color ambient{0.0f, 0.0f, 0.0f};
    Color diffuse{0.8f, 0.8f, 0.8f};
    Color specular{0.0f, 0.0f, 0.0f};
    Color emissive{0.0f, 0.0f, 0.0f};
    float shininess = 30.0f;
    float opacity = 1.0f;

    std::shared_ptr<Texture> diffuseMap;
    std::shared_ptr<Texture> specularMap;
    std::shared_ptr<Texture> bumpMap;

    // Material used for geometry loaded without a material library.
    static std::shared_ptr<const Material> defaultMaterial();
};

struct MaterialStatement {
    std::string key; // lower-cased
    std::vector<std::string> args;
};

// Raw statements of one `newmtl` block, in file order.
struct MaterialDefinition {
    std::string name;
    std::vector<MaterialStatement> statements;

    // Arguments of the last `key` statement, or nullptr.
    const std::vector<std::string> *find(const std::string &key) const;
};

// Material library parsed from an MTL file. Definitions are turned into
// Material objects by preload(); create() hands out the preloaded instances.
class MaterialSet {
 public:
    MaterialSet() = default;
    MaterialSet(std::string baseDirectory, std::vector<MaterialDefinition> definitions);

    const std::string &baseDirectory() const { return baseDirectory_; }
    const std::vector<MaterialDefinition> &definitions() const { return definitions_; }

    // Builds every material and resolves its texture maps. Safe to call more than once.
    void preload();
    bool preloaded() const { return preloaded_; }

    // Returns the material named `name`, building it on demand, or nullptr when unknown.
    std::shared_ptr<const Material> create(const std::string &name);

    std::size_t size() const { return definitions_.size(); }

 private:
    std::string baseDirectory_;
    std::vector<MaterialDefinition> definitions_;
    std::map<std::string, std::shared_ptr<Material>> materials_;
    bool preloaded_ = false;

    std::shared_ptr<Material> build(const MaterialDefinition &def) const;
    std::shared_ptr<Texture> loadTexture(const std::vector<std::string> &args) const;
};

} // namespace scene

#endif // __MATERIAL_HXX__
