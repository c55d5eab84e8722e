#include "player/Player.hxx"

#include <stdexcept>
#include <utility>

namespace player {

Player::Player(EventLoop &loop, PlayerServices services, PlayerConfig config, Log *log)
    : loop_(loop), services_(std::move(services)), config_(std::move(config)), log_(log) {
    config_.validate();
    if (!services_.renderer || !services_.geometryLoader || !services_.materialLoader) {
        throw std::invalid_argument("Player: renderer, geometry loader and material loader are required");
    }
    if (!log_) {
        ownLog_ = std::make_unique<Log>("Player3D");
        log_ = ownLog_.get();
    }
}

Player::~Player() {
    if (renderLoop_) renderLoop_->stop();
    if (assets_) assets_->cancelAll();
    if (container_) container_->removeInputListener(this);
}

void Player::requireInitialized(const char *what) const {
    if (!container_) {
        throw PlayerError(PlayerError::Kind::NotInitialized, std::string("Player::") + what + " before initialize()");
    }
}

void Player::measure(Container &container) {
    width_ = container.width();
    // Height is derived before the container layout is touched.
    height_ = width_ / config_.aspectRatio;
    container.setHeight(height_);

    center_ = PointerPosition{width_ / 2.0, height_ / 2.0};
}

void Player::initialize(Container *container) {
    if (container_) {
        throw PlayerError(PlayerError::Kind::AlreadyInitialized, "Player::initialize called twice");
    }
    if (!container || !container->attached()) {
        throw PlayerError(PlayerError::Kind::InvalidContainer, "Player::initialize: container is null or detached");
    }
    if (!(container->width() > 0.0)) {
        throw PlayerError(PlayerError::Kind::InvalidContainer, "Player::initialize: container has no width");
    }

    // Built into locals and committed once the container accepts the surface.
    measure(*container);
    pointer_ = PointerPosition{0.0, 0.0};

    (*log_)("Rendering into container of", width_, "x", height_);

    auto scene = std::make_unique<scene::Scene>();

    const CameraConfig &cc = config_.camera;
    auto camera = std::make_unique<scene::PerspectiveCamera>(cc.fov, width_ / height_, cc.near, cc.far);
    camera->name = "camera";
    camera->position.z() = cc.distance;

    const LightingConfig &lc = config_.lighting;
    auto ambient = std::make_unique<scene::AmbientLight>(lc.ambientColor, lc.ambientIntensity);
    ambient->name = "ambient";
    scene->add(std::move(ambient));

    auto point = std::make_unique<scene::PointLight>(lc.pointColor, lc.pointIntensity);
    point->name = "camera-light";
    camera->add(std::move(point));

    auto *cameraNode = static_cast<scene::PerspectiveCamera *>(&scene->add(std::move(camera)));

    auto controls = std::make_unique<TrackballControls>(*cameraNode, container);
    controls->configure(config_.controls);

    auto assets = std::make_unique<AssetLoadOrchestrator>(*scene, *controls, events_, *services_.geometryLoader,
                                                          *services_.materialLoader, *log_);
    auto renderLoop = std::make_unique<RenderLoop>(loop_, [this]() { renderFrame(); }, config_.targetFrameRate);

    Renderer &renderer = *services_.renderer;
    renderer.setPixelRatio(config_.pixelRatio);
    renderer.setSize(width_, height_);
    container->attach(renderer);

    container->addInputListener(this);

    scene_ = std::move(scene);
    camera_ = cameraNode;
    controls_ = std::move(controls);
    assets_ = std::move(assets);
    renderLoop_ = std::move(renderLoop);
    container_ = container;

    events_.emit(kLoaded);
}

void Player::start() {
    requireInitialized("start");
    if (renderLoop_->running()) {
        (*log_)("Render loop already running");
        return;
    }
    renderLoop_->start();
}

void Player::stop() {
    requireInitialized("stop");
    renderLoop_->stop();
}

void Player::show() {
    requireInitialized("show");
    container_->setVisible(true);
}

void Player::hide() {
    requireInitialized("hide");
    container_->setVisible(false);
}

LoadHandle Player::loadGeometry(const std::string &url) {
    requireInitialized("loadGeometry");
    return assets_->loadGeometry(url);
}

LoadHandle Player::loadGeometryWithMaterial(const std::string &geometryUrl, const std::string &materialUrl) {
    requireInitialized("loadGeometryWithMaterial");
    return assets_->loadGeometryWithMaterial(geometryUrl, materialUrl);
}

void Player::resize() {
    requireInitialized("resize");
    if (!(container_->width() > 0.0)) {
        return; // minimized; keep the last viewport
    }

    measure(*container_);

    Renderer &renderer = *services_.renderer;
    container_->clear();
    renderer.setSize(width_, height_);
    container_->attach(renderer);

    camera_->aspect = width_ / height_;
    camera_->updateProjectionMatrix();
    controls_->handleResize();
}

void Player::renderFrame() {
    controls_->update();
    camera_->lookAt(scene_->position);
    services_.renderer->render(*scene_, *camera_);
}

void Player::onPointerMove(double x, double y) {
    pointer_ = PointerPosition{(x - center_.x) / 2.0, (y - center_.y) / 2.0};
}

scene::Scene &Player::scene() {
    requireInitialized("scene");
    return *scene_;
}

scene::PerspectiveCamera &Player::camera() {
    requireInitialized("camera");
    return *camera_;
}

TrackballControls &Player::controls() {
    requireInitialized("controls");
    return *controls_;
}

RenderLoop &Player::renderLoop() {
    requireInitialized("renderLoop");
    return *renderLoop_;
}

} // namespace player
