#pragma once

#include <memory>
#include <string>
#include <vector>

#include "player/EventChannel.hxx"
#include "player/LoadResult.hxx"
#include "player/Loaders.hxx"
#include "player/Log.hxx"
#include "player/TrackballControls.hxx"

#include "scene/Object3D.hxx"

namespace player {

// Runs load requests against the loader collaborators and places the
// results: vertical centering, insertion under `scene`, controls reset and a
// `model-loaded` event. Failures settle the handle and emit `model-load-failed`.
//
// Concurrent requests are independent; each is placed when it completes.
class AssetLoadOrchestrator {
 public:
    AssetLoadOrchestrator(scene::Scene &scene, TrackballControls &controls, EventChannel &events,
                          GeometryLoader &geometryLoader, MaterialLoader &materialLoader, Log &log);
    ~AssetLoadOrchestrator();

    AssetLoadOrchestrator(const AssetLoadOrchestrator &) = delete;
    AssetLoadOrchestrator &operator=(const AssetLoadOrchestrator &) = delete;

    LoadHandle loadGeometry(const std::string &url);

    // The material library is loaded and preloaded before the geometry load starts.
    LoadHandle loadGeometryWithMaterial(const std::string &geometryUrl, const std::string &materialUrl);

    // Cancels every request still in flight.
    void cancelAll();

    std::size_t inFlight() const;

 private:
    scene::Scene &scene_;
    TrackballControls &controls_;
    EventChannel &events_;
    GeometryLoader &geometryLoader_;
    MaterialLoader &materialLoader_;
    Log &log_;
    LoadingManager manager_;

    std::vector<std::weak_ptr<LoadTask>> tasks_;

    std::shared_ptr<LoadTask> track(const std::string &url, const std::string &materialUrl);
    void fetchGeometry(const std::shared_ptr<LoadTask> &task, std::shared_ptr<scene::MaterialSet> materials);
    void place(const std::shared_ptr<LoadTask> &task, std::unique_ptr<scene::Group> object);
    void fail(const std::shared_ptr<LoadTask> &task, const LoadError &error);
};

} // namespace player
