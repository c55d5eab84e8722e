#include "scene/Material.hxx"

#include <filesystem>
#include <utility>

namespace scene {

Color colorFromHex(unsigned int hex) {
    return Color(static_cast<float>((hex >> 16) & 0xff) / 255.0f,
                 static_cast<float>((hex >> 8) & 0xff) / 255.0f,
                 static_cast<float>(hex & 0xff) / 255.0f);
}

std::shared_ptr<const Material> Material::defaultMaterial() {
    static const std::shared_ptr<const Material> instance = [] {
        auto m = std::make_shared<Material>();
        m->name = "default";
        return m;
    }();
    return instance;
}

const std::vector<std::string> *MaterialDefinition::find(const std::string &key) const {
    for (auto it = statements.rbegin(); it != statements.rend(); ++it) {
        if (it->key == key) return &it->args;
    }
    return nullptr;
}

MaterialSet::MaterialSet(std::string baseDirectory, std::vector<MaterialDefinition> definitions)
    : baseDirectory_(std::move(baseDirectory)), definitions_(std::move(definitions)) {}

void MaterialSet::preload() {
    for (const auto &def : definitions_) {
        if (materials_.count(def.name)) continue;
        materials_.emplace(def.name, build(def));
    }
    preloaded_ = true;
}

std::shared_ptr<const Material> MaterialSet::create(const std::string &name) {
    auto it = materials_.find(name);
    if (it != materials_.end()) return it->second;

    for (const auto &def : definitions_) {
        if (def.name == name) {
            auto m = build(def);
            materials_.emplace(name, m);
            return m;
        }
    }
    return nullptr;
}

static Color readColor(const std::vector<std::string> &args) {
    // The parser guarantees three numeric components for color statements.
    return Color(std::stof(args[0]), std::stof(args[1]), std::stof(args[2]));
}

std::shared_ptr<Material> MaterialSet::build(const MaterialDefinition &def) const {
    auto m = std::make_shared<Material>();
    m->name = def.name;

    // Later statements override earlier ones, so `d` and `Tr` apply in file order.
    for (const auto &statement : def.statements) {
        const std::string &key = statement.key;
        const std::vector<std::string> &args = statement.args;

        if (key == "ka") {
            m->ambient = readColor(args);
        } else if (key == "kd") {
            m->diffuse = readColor(args);
        } else if (key == "ks") {
            m->specular = readColor(args);
        } else if (key == "ke") {
            m->emissive = readColor(args);
        } else if (key == "ns") {
            m->shininess = std::stof(args[0]);
        } else if (key == "d") {
            m->opacity = std::stof(args[0]);
        } else if (key == "tr") {
            m->opacity = 1.0f - std::stof(args[0]);
        } else if (key == "map_kd") {
            m->diffuseMap = loadTexture(args);
        } else if (key == "map_ks") {
            m->specularMap = loadTexture(args);
        } else if (key == "map_bump" || key == "bump") {
            m->bumpMap = loadTexture(args);
        }
    }
    return m;
}

std::shared_ptr<Texture> MaterialSet::loadTexture(const std::vector<std::string> &args) const {
    // Map options (-bm 1, -s 1 1 1, ...) precede the file name.
    auto tex = std::make_shared<Texture>();
    namespace fs = std::filesystem;
    fs::path file(args.back());
    if (file.is_relative() && !baseDirectory_.empty()) {
        file = fs::path(baseDirectory_) / file;
    }
    tex->path = file.lexically_normal().string();

    std::error_code ec;
    tex->available = fs::is_regular_file(file, ec);
    return tex;
}

} // namespace scene
