#pragma once

#include <memory>
#include <string>

#include "player/AssetLoadOrchestrator.hxx"
#include "player/Config.hxx"
#include "player/Container.hxx"
#include "player/EventChannel.hxx"
#include "player/EventLoop.hxx"
#include "player/LoadResult.hxx"
#include "player/Loaders.hxx"
#include "player/Log.hxx"
#include "player/PlayerError.hxx"
#include "player/RenderLoop.hxx"
#include "player/Renderer.hxx"
#include "player/TrackballControls.hxx"

#include "scene/Camera.hxx"
#include "scene/Object3D.hxx"

namespace player {

// Pointer position relative to the viewport center, halved.
struct PointerPosition {
    double x = 0.0;
    double y = 0.0;
};

// Collaborators owned by a Player.
struct PlayerServices {
    std::unique_ptr<Renderer> renderer;
    std::unique_ptr<GeometryLoader> geometryLoader;
    std::unique_ptr<MaterialLoader> materialLoader;
};

// 3D model player: camera, lights and trackball controls around a scene
// graph, drawn into a container at a fixed frame rate.
//
// Usage: construct, subscribe to events(), initialize(container), start(),
// then loadGeometry()/loadGeometryWithMaterial(). The container and the
// event loop must outlive the player.
class Player : public InputListener {
 public:
    Player(EventLoop &loop, PlayerServices services, PlayerConfig config = PlayerConfig(), Log *log = nullptr);
    ~Player() override;

    Player(const Player &) = delete;
    Player &operator=(const Player &) = delete;

    // Builds the viewer inside `container` and emits `loaded`.
    // Throws PlayerError(InvalidContainer) for a null, detached or zero-width container.
    void initialize(Container *container);
    bool initialized() const { return container_ != nullptr; }

    EventSubscriber events() { return EventSubscriber(events_); }

    void start();
    void stop();

    void show();
    void hide();

    LoadHandle loadGeometry(const std::string &url);
    LoadHandle loadGeometryWithMaterial(const std::string &geometryUrl, const std::string &materialUrl);

    // Re-derive the viewport from the container width and rebuild the output surface.
    void resize();

    // One frame: controls update, camera aimed at the scene origin, render.
    void renderFrame();

    double width() const { return width_; }
    double height() const { return height_; }
    double aspectRatio() const { return config_.aspectRatio; }
    double targetFrameRate() const { return config_.targetFrameRate; }
    const PointerPosition &pointer() const { return pointer_; }
    const PlayerConfig &config() const { return config_; }

    scene::Scene &scene();
    scene::PerspectiveCamera &camera();
    TrackballControls &controls();
    RenderLoop &renderLoop();
    Log &log() { return *log_; }

    void onResize() override { resize(); }
    void onPointerMove(double x, double y) override;

 private:
    EventLoop &loop_;
    PlayerServices services_;
    PlayerConfig config_;

    std::unique_ptr<Log> ownLog_;
    Log *log_;

    EventChannel events_;

    Container *container_ = nullptr;

    double width_ = 0.0;
    double height_ = 0.0;
    PointerPosition center_;
    PointerPosition pointer_;

    std::unique_ptr<scene::Scene> scene_;
    scene::PerspectiveCamera *camera_ = nullptr; // owned by scene_
    std::unique_ptr<TrackballControls> controls_;
    std::unique_ptr<AssetLoadOrchestrator> assets_;
    std::unique_ptr<RenderLoop> renderLoop_;

    void requireInitialized(const char *what) const;
    void measure(Container &container);
};

} // namespace player
