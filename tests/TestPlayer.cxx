#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "Fakes.hxx"

#include "player/Player.hxx"

namespace {

class PlayerTest : public ::testing::Test {
 protected:
    double now = 0.0;
    player::EventLoop loop{[this]() { return now; }};
    std::ostringstream logStream;
    player::Log log{"Test", logStream};
    fakes::FakeContainer container{1600.0};
    std::vector<std::string> calls;

    fakes::FakeRenderer *renderer = nullptr;
    std::unique_ptr<player::Player> player;

    void SetUp() override {
        player::PlayerServices services;
        auto r = std::make_unique<fakes::FakeRenderer>();
        renderer = r.get();
        services.renderer = std::move(r);
        services.geometryLoader = std::make_unique<fakes::FakeGeometryLoader>(loop, &calls);
        services.materialLoader = std::make_unique<fakes::FakeMaterialLoader>(loop, &calls);
        player = std::make_unique<player::Player>(loop, std::move(services), player::PlayerConfig(), &log);
    }

    player::PlayerError::Kind initializeError(player::Container *c) {
        try {
            player->initialize(c);
        } catch (const player::PlayerError &e) {
            return e.kind();
        }
        ADD_FAILURE() << "initialize did not throw";
        return player::PlayerError::Kind::AlreadyInitialized;
    }
};

TEST_F(PlayerTest, InitializeDerivesHeightFromWidth) {
    int loaded = 0;
    player->events().subscribe(player::kLoaded, [&loaded](const player::Event &) { ++loaded; });

    player->initialize(&container);

    EXPECT_DOUBLE_EQ(player->width(), 1600.0);
    EXPECT_DOUBLE_EQ(player->height(), 1600.0 / (16.0 / 9.0));
    EXPECT_NEAR(player->height(), 900.0, 1e-9);
    EXPECT_DOUBLE_EQ(container.height(), player->height());
    EXPECT_EQ(loaded, 1);

    ASSERT_FALSE(renderer->sizes.empty());
    EXPECT_DOUBLE_EQ(renderer->sizes.back().first, 1600.0);
    EXPECT_NEAR(renderer->sizes.back().second, 900.0, 1e-9);
    EXPECT_DOUBLE_EQ(renderer->pixelRatio, 1.0);
    EXPECT_EQ(container.surface, renderer);
}

TEST_F(PlayerTest, InitializeBuildsCameraAndLights) {
    player->initialize(&container);

    scene::PerspectiveCamera &camera = player->camera();
    EXPECT_DOUBLE_EQ(camera.fov, 45.0);
    EXPECT_DOUBLE_EQ(camera.near, 1.0);
    EXPECT_DOUBLE_EQ(camera.far, 2500.0);
    EXPECT_DOUBLE_EQ(camera.position.z(), 250.0);
    EXPECT_NEAR(camera.aspect, 16.0 / 9.0, 1e-12);
    EXPECT_EQ(camera.parent(), &player->scene());

    int ambient = 0;
    player->scene().traverse([&ambient](const scene::Object3D &n) {
        if (n.kind() == scene::Object3D::Kind::AmbientLight) ++ambient;
    });
    EXPECT_EQ(ambient, 1);

    ASSERT_EQ(camera.children().size(), 1u);
    const scene::Object3D &light = *camera.children().front();
    ASSERT_EQ(light.kind(), scene::Object3D::Kind::PointLight);
    EXPECT_FLOAT_EQ(static_cast<const scene::PointLight &>(light).intensity, 0.8f);
}

TEST_F(PlayerTest, ResizeFollowsContainerWidth) {
    player->initialize(&container);
    int clearsBefore = container.clears;

    container.setWidth(800.0);
    container.fireResize();

    EXPECT_DOUBLE_EQ(player->width(), 800.0);
    EXPECT_NEAR(player->height(), 450.0, 1e-9);
    EXPECT_NEAR(container.height(), 450.0, 1e-9);
    EXPECT_EQ(container.clears, clearsBefore + 1);
    EXPECT_EQ(container.surface, renderer);
    EXPECT_DOUBLE_EQ(renderer->sizes.back().first, 800.0);
    EXPECT_NEAR(renderer->sizes.back().second, 450.0, 1e-9);
    EXPECT_NEAR(player->camera().aspect, 800.0 / 450.0, 1e-12);
}

TEST_F(PlayerTest, ResizeIsIdempotent) {
    player->initialize(&container);
    player->resize();
    double h = player->height();
    player->resize();
    EXPECT_DOUBLE_EQ(player->height(), h);
    EXPECT_DOUBLE_EQ(player->height(), player->width() / player->aspectRatio());
}

TEST_F(PlayerTest, ResizeWithZeroWidthKeepsViewport) {
    player->initialize(&container);
    std::size_t sizes = renderer->sizes.size();

    container.setWidth(0.0);
    container.fireResize();

    EXPECT_DOUBLE_EQ(player->width(), 1600.0);
    EXPECT_EQ(renderer->sizes.size(), sizes);
}

TEST_F(PlayerTest, CustomAspectRatio) {
    player::PlayerServices services;
    services.renderer = std::make_unique<fakes::FakeRenderer>();
    services.geometryLoader = std::make_unique<fakes::FakeGeometryLoader>(loop, nullptr);
    services.materialLoader = std::make_unique<fakes::FakeMaterialLoader>(loop, nullptr);
    player::PlayerConfig config;
    config.aspectRatio = 4.0 / 3.0;

    fakes::FakeContainer other(1200.0);
    player::Player p(loop, std::move(services), config, &log);
    p.initialize(&other);

    EXPECT_NEAR(p.height(), 900.0, 1e-9);
}

TEST_F(PlayerTest, RejectsInvalidContainers) {
    EXPECT_EQ(initializeError(nullptr), player::PlayerError::Kind::InvalidContainer);

    fakes::FakeContainer detached(1600.0);
    detached.setAttached(false);
    EXPECT_EQ(initializeError(&detached), player::PlayerError::Kind::InvalidContainer);

    fakes::FakeContainer empty(0.0);
    EXPECT_EQ(initializeError(&empty), player::PlayerError::Kind::InvalidContainer);

    EXPECT_FALSE(player->initialized());
}

TEST_F(PlayerTest, InitializeTwiceThrows) {
    player->initialize(&container);
    EXPECT_EQ(initializeError(&container), player::PlayerError::Kind::AlreadyInitialized);
}

TEST_F(PlayerTest, FailedInitializeLeavesPlayerUninitialized) {
    container.failAttach = true;
    EXPECT_THROW(player->initialize(&container), std::runtime_error);

    EXPECT_FALSE(player->initialized());
    EXPECT_EQ(container.listenerCount(), 0u);
    EXPECT_THROW(player->start(), player::PlayerError);

    container.failAttach = false;
    player->initialize(&container);
    EXPECT_TRUE(player->initialized());
    EXPECT_EQ(container.surface, renderer);

    player->start();
    EXPECT_EQ(renderer->renders, 1);
}

TEST_F(PlayerTest, OperationsRequireInitialize) {
    EXPECT_THROW(player->start(), player::PlayerError);
    EXPECT_THROW(player->stop(), player::PlayerError);
    EXPECT_THROW(player->show(), player::PlayerError);
    EXPECT_THROW(player->hide(), player::PlayerError);
    EXPECT_THROW(player->resize(), player::PlayerError);
    EXPECT_THROW(player->loadGeometry("model.obj"), player::PlayerError);
    EXPECT_THROW(player->loadGeometryWithMaterial("model.obj", "model.mtl"), player::PlayerError);

    try {
        player->start();
    } catch (const player::PlayerError &e) {
        EXPECT_EQ(e.kind(), player::PlayerError::Kind::NotInitialized);
    }
    EXPECT_TRUE(calls.empty());
}

TEST_F(PlayerTest, ConstructorValidatesConfig) {
    player::PlayerServices services;
    services.renderer = std::make_unique<fakes::FakeRenderer>();
    services.geometryLoader = std::make_unique<fakes::FakeGeometryLoader>(loop, nullptr);
    services.materialLoader = std::make_unique<fakes::FakeMaterialLoader>(loop, nullptr);
    player::PlayerConfig config;
    config.targetFrameRate = 0.0;

    EXPECT_THROW(player::Player(loop, std::move(services), config, &log), std::invalid_argument);
}

TEST_F(PlayerTest, ConstructorRequiresServices) {
    EXPECT_THROW(player::Player(loop, player::PlayerServices(), player::PlayerConfig(), &log),
                 std::invalid_argument);
}

TEST_F(PlayerTest, StartRendersImmediatelyAndOnlyOnce) {
    player->initialize(&container);

    player->start();
    EXPECT_EQ(renderer->renders, 1);
    EXPECT_EQ(renderer->lastScene, &player->scene());
    EXPECT_EQ(renderer->lastCamera, &player->camera());

    player->start();
    EXPECT_EQ(renderer->renders, 1);
    EXPECT_EQ(loop.frameRequestCount(), 1u);
    EXPECT_TRUE(player->renderLoop().running());
}

TEST_F(PlayerTest, StopHaltsRendering) {
    player->initialize(&container);
    player->start();
    player->stop();

    loop.runFrame();
    now += 1000.0;
    loop.runPending();

    EXPECT_EQ(renderer->renders, 1);
    EXPECT_FALSE(player->renderLoop().running());
    EXPECT_EQ(loop.timerCount(), 0u);
}

TEST_F(PlayerTest, ShowAndHideOnlyToggleVisibility) {
    player->initialize(&container);
    player->start();

    std::size_t children = player->scene().children().size();
    Eigen::Vector3d position = player->camera().position;
    Eigen::Quaterniond orientation = player->camera().quaternion;
    double aspect = player->camera().aspect;
    std::size_t sizes = renderer->sizes.size();
    std::pair<double, double> size = renderer->sizes.back();

    player->hide();
    EXPECT_FALSE(container.visible());
    EXPECT_TRUE(player->renderLoop().running());
    EXPECT_EQ(player->scene().children().size(), children);
    EXPECT_EQ(renderer->sizes.size(), sizes);

    player->show();
    EXPECT_TRUE(container.visible());
    EXPECT_DOUBLE_EQ(player->height(), 1600.0 / (16.0 / 9.0));

    EXPECT_EQ(player->scene().children().size(), children);
    EXPECT_TRUE(player->camera().position.isApprox(position));
    EXPECT_TRUE(player->camera().quaternion.isApprox(orientation));
    EXPECT_DOUBLE_EQ(player->camera().aspect, aspect);
    EXPECT_EQ(renderer->sizes.size(), sizes);
    EXPECT_EQ(renderer->sizes.back(), size);
    EXPECT_EQ(container.clears, 0);
}

TEST_F(PlayerTest, PointerIsRelativeToCenterHalved) {
    player->initialize(&container);

    container.firePointerMove(810.0, 470.0);
    EXPECT_DOUBLE_EQ(player->pointer().x, 5.0);
    EXPECT_NEAR(player->pointer().y, 10.0, 1e-9);

    container.firePointerMove(0.0, 0.0);
    EXPECT_DOUBLE_EQ(player->pointer().x, -400.0);
    EXPECT_NEAR(player->pointer().y, -225.0, 1e-9);
}

TEST_F(PlayerTest, DestructionUnregistersListeners) {
    player->initialize(&container);
    EXPECT_GT(container.listenerCount(), 0u);

    player.reset();
    EXPECT_EQ(container.listenerCount(), 0u);
}

} // namespace
