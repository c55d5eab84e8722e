#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "player/EventLoop.hxx"
#include "player/LoadResult.hxx"
#include "player/Log.hxx"

#include "scene/Material.hxx"
#include "scene/Object3D.hxx"

namespace player {

struct LoadProgress {
    std::string url;
    std::size_t loaded = 0;
    std::size_t total = 0;
};

typedef std::function<void(const LoadProgress &)> ProgressCallback;
typedef std::function<void(const LoadError &)> ErrorCallback;

// Asynchronous geometry source. Exactly one of onLoad/onError is called, later,
// from the event loop; onProgress may be called any number of times before.
class GeometryLoader {
 public:
    typedef std::function<void(std::unique_ptr<scene::Group>)> LoadCallback;

    virtual ~GeometryLoader() = default;

    // `materials` may be null: meshes then get the default material.
    virtual void load(const std::string &url, std::shared_ptr<scene::MaterialSet> materials,
                      LoadCallback onLoad, ProgressCallback onProgress, ErrorCallback onError) = 0;
};

// Asynchronous material library source, same callback contract as GeometryLoader.
class MaterialLoader {
 public:
    typedef std::function<void(std::shared_ptr<scene::MaterialSet>)> LoadCallback;

    virtual ~MaterialLoader() = default;

    virtual void load(const std::string &url, LoadCallback onLoad, ProgressCallback onProgress,
                      ErrorCallback onError) = 0;
};

// Routes loader progress and errors to the log.
class LoadingManager {
 public:
    explicit LoadingManager(Log &log) : log_(log) {}

    ProgressCallback onProgress();
    ErrorCallback onError();

 private:
    Log &log_;
};

// Maps `path` or `file://path` to a filesystem path. Other schemes fail with
// UnsupportedScheme; missing files with NotFound.
bool resolveLocalFile(const std::string &url, std::string &path, LoadError &error);

// Wavefront OBJ from local files.
class ObjLoader : public GeometryLoader {
 public:
    explicit ObjLoader(EventLoop &loop) : loop_(loop) {}

    void load(const std::string &url, std::shared_ptr<scene::MaterialSet> materials,
              LoadCallback onLoad, ProgressCallback onProgress, ErrorCallback onError) override;

 private:
    EventLoop &loop_;
};

// Wavefront MTL from local files. Texture paths resolve against the MTL file's directory.
class MtlLoader : public MaterialLoader {
 public:
    explicit MtlLoader(EventLoop &loop) : loop_(loop) {}

    void load(const std::string &url, LoadCallback onLoad, ProgressCallback onProgress,
              ErrorCallback onError) override;

 private:
    EventLoop &loop_;
};

} // namespace player
