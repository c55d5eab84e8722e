#include "player/Loaders.hxx"

#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "scene/MtlParser.hxx"
#include "scene/ObjParser.hxx"

namespace player {

ProgressCallback LoadingManager::onProgress() {
    return [this](const LoadProgress &p) {
        log_("Loading", p.url, p.loaded, "/", p.total, "bytes");
    };
}

ErrorCallback LoadingManager::onError() {
    return [this](const LoadError &e) {
        log_("Failed to load", e.url, "(" + std::string(toString(e.kind)) + "):", e.message);
    };
}

bool resolveLocalFile(const std::string &url, std::string &path, LoadError &error) {
    static const std::string kFileScheme = "file://";

    error.url = url;
    std::string p = url;
    if (p.compare(0, kFileScheme.size(), kFileScheme) == 0) {
        p = p.substr(kFileScheme.size());
    } else if (p.find("://") != std::string::npos) {
        error.kind = LoadErrorKind::UnsupportedScheme;
        error.message = "only local files can be loaded";
        return false;
    }

    std::error_code ec;
    if (p.empty() || !std::filesystem::is_regular_file(p, ec)) {
        error.kind = LoadErrorKind::NotFound;
        error.message = "no such file: " + p;
        return false;
    }
    path = p;
    return true;
}

// Reads the whole file, reporting its size as progress.
static bool readFile(const std::string &url, std::string &contents, std::string &path,
                     const ProgressCallback &onProgress, LoadError &error) {
    if (!resolveLocalFile(url, path, error)) return false;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error.kind = LoadErrorKind::Io;
        error.message = "failed to open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        error.kind = LoadErrorKind::Io;
        error.message = "failed to read " + path;
        return false;
    }
    contents = ss.str();
    if (onProgress) onProgress(LoadProgress{url, contents.size(), contents.size()});
    return true;
}

void ObjLoader::load(const std::string &url, std::shared_ptr<scene::MaterialSet> materials,
                     LoadCallback onLoad, ProgressCallback onProgress, ErrorCallback onError) {
    loop_.post([url, materials, onLoad, onProgress, onError]() {
        LoadError error{LoadErrorKind::Io, url, ""};
        std::string contents, path;
        if (!readFile(url, contents, path, onProgress, error)) {
            if (onError) onError(error);
            return;
        }

        std::unique_ptr<scene::Group> object;
        try {
            std::istringstream in(contents);
            scene::ObjModel model = scene::parseObj(in, path);
            object = scene::buildObject(model, materials.get());
        } catch (const scene::ParseError &e) {
            if (onError) onError(LoadError{LoadErrorKind::Parse, url, e.what()});
            return;
        } catch (const std::exception &e) {
            if (onError) onError(LoadError{LoadErrorKind::Parse, url, std::string("invalid model: ") + e.what()});
            return;
        }
        object->name = std::filesystem::path(path).stem().string();
        if (onLoad) onLoad(std::move(object));
    });
}

void MtlLoader::load(const std::string &url, LoadCallback onLoad, ProgressCallback onProgress,
                     ErrorCallback onError) {
    loop_.post([url, onLoad, onProgress, onError]() {
        LoadError error{LoadErrorKind::Io, url, ""};
        std::string contents, path;
        if (!readFile(url, contents, path, onProgress, error)) {
            if (onError) onError(error);
            return;
        }

        std::vector<scene::MaterialDefinition> defs;
        try {
            std::istringstream in(contents);
            defs = scene::parseMtl(in, path);
        } catch (const scene::ParseError &e) {
            if (onError) onError(LoadError{LoadErrorKind::Parse, url, e.what()});
            return;
        } catch (const std::exception &e) {
            if (onError) onError(LoadError{LoadErrorKind::Parse, url, std::string("invalid material library: ") + e.what()});
            return;
        }

        std::string base = std::filesystem::path(path).parent_path().string();
        if (onLoad) onLoad(std::make_shared<scene::MaterialSet>(base, std::move(defs)));
    });
}

} // namespace player
