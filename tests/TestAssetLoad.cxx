#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "Fakes.hxx"

#include "player/Player.hxx"

namespace {

class AssetLoadTest : public ::testing::Test {
 protected:
    player::EventLoop loop{[]() { return 0.0; }};
    std::ostringstream logStream;
    player::Log log{"Test", logStream};
    fakes::FakeContainer container{1600.0};
    std::vector<std::string> calls;

    fakes::FakeGeometryLoader *geometry = nullptr;
    fakes::FakeMaterialLoader *materials = nullptr;
    std::unique_ptr<player::Player> player;

    std::vector<const player::LoadResult *> loaded;
    std::vector<player::LoadResult> failed;

    void SetUp() override {
        player::PlayerServices services;
        services.renderer = std::make_unique<fakes::FakeRenderer>();
        auto g = std::make_unique<fakes::FakeGeometryLoader>(loop, &calls);
        auto m = std::make_unique<fakes::FakeMaterialLoader>(loop, &calls);
        geometry = g.get();
        materials = m.get();
        services.geometryLoader = std::move(g);
        services.materialLoader = std::move(m);

        player = std::make_unique<player::Player>(loop, std::move(services), player::PlayerConfig(), &log);
        player->events().subscribe(player::kModelLoaded,
                                   [this](const player::Event &e) { loaded.push_back(e.result); });
        player->events().subscribe(player::kModelLoadFailed,
                                   [this](const player::Event &e) { failed.push_back(*e.result); });
        player->initialize(&container);
    }

    void drain() {
        while (loop.hasImmediate()) {
            loop.runPending();
        }
    }

    std::size_t topLevelCount() { return player->scene().children().size(); }
};

TEST_F(AssetLoadTest, LoadedModelIsCenteredAndInsertedOnce) {
    std::size_t before = topLevelCount();

    player::LoadHandle handle = player->loadGeometry("models/slab.obj");
    EXPECT_EQ(handle.state(), player::LoadState::Pending);
    EXPECT_EQ(topLevelCount(), before);
    EXPECT_THROW(handle.result(), std::logic_error);

    drain();

    ASSERT_EQ(handle.state(), player::LoadState::Succeeded);
    ASSERT_EQ(topLevelCount(), before + 1);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_TRUE(failed.empty());

    const player::LoadResult &result = handle.result();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.url, "models/slab.obj");
    EXPECT_TRUE(result.materialUrl.empty());
    EXPECT_EQ(result.node, player->scene().children().back().get());
    EXPECT_EQ(loaded.front(), &result);

    // slab spans y in [10, 30]
    EXPECT_DOUBLE_EQ(result.node->position.y(), -20.0);
    scene::Box3 box = scene::computeBoundingBox(*result.node);
    EXPECT_NEAR(box.center().y(), 0.0, 1e-9);
    EXPECT_EQ(player->controls().state(), player::TrackballControls::State::None);
}

TEST_F(AssetLoadTest, GeometryOnlyLoadSkipsMaterials) {
    player->loadGeometry("a.obj");
    drain();

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], "geometry:a.obj");
    EXPECT_EQ(geometry->lastMaterials, nullptr);
}

TEST_F(AssetLoadTest, MaterialsLoadBeforeGeometry) {
    player::LoadHandle handle = player->loadGeometryWithMaterial("a.obj", "a.mtl");

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], "material:a.mtl");

    drain();

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1], "geometry:a.obj");
    ASSERT_NE(geometry->lastMaterials, nullptr);
    EXPECT_TRUE(geometry->lastMaterials->preloaded());
    EXPECT_NE(geometry->lastMaterials->create("red"), nullptr);

    ASSERT_EQ(handle.state(), player::LoadState::Succeeded);
    EXPECT_EQ(handle.result().materialUrl, "a.mtl");
    EXPECT_EQ(loaded.size(), 1u);
}

TEST_F(AssetLoadTest, LoadResetsControls) {
    player->camera().position = Eigen::Vector3d(40.0, 10.0, 90.0);
    player->controls().target = Eigen::Vector3d(1.0, 2.0, 3.0);

    player->loadGeometry("a.obj");
    drain();

    EXPECT_TRUE(player->camera().position.isApprox(Eigen::Vector3d(0.0, 0.0, 250.0)));
    EXPECT_TRUE(player->controls().target.isZero());
}

TEST_F(AssetLoadTest, GeometryFailureEmitsFailedEvent) {
    geometry->failures["missing.obj"] = player::LoadError{player::LoadErrorKind::NotFound, "missing.obj", "gone"};
    std::size_t before = topLevelCount();

    player::LoadHandle handle = player->loadGeometry("missing.obj");
    drain();

    EXPECT_EQ(handle.state(), player::LoadState::Failed);
    EXPECT_EQ(handle.result().error, player::LoadErrorKind::NotFound);
    EXPECT_EQ(handle.result().message, "gone");
    EXPECT_EQ(topLevelCount(), before);
    EXPECT_TRUE(loaded.empty());
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].url, "missing.obj");
    EXPECT_NE(logStream.str().find("missing.obj"), std::string::npos);
}

TEST_F(AssetLoadTest, MaterialFailureSkipsGeometry) {
    materials->failures["bad.mtl"] = player::LoadError{player::LoadErrorKind::Parse, "bad.mtl", "bad.mtl:3: oops"};

    player::LoadHandle handle = player->loadGeometryWithMaterial("a.obj", "bad.mtl");
    drain();

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(handle.state(), player::LoadState::Failed);
    EXPECT_EQ(handle.result().error, player::LoadErrorKind::Parse);
    EXPECT_EQ(handle.result().url, "a.obj");
    EXPECT_EQ(handle.result().materialUrl, "bad.mtl");
    EXPECT_EQ(failed.size(), 1u);
    EXPECT_TRUE(loaded.empty());
}

TEST_F(AssetLoadTest, CancelledLoadInsertsNothing) {
    std::size_t before = topLevelCount();

    player::LoadHandle handle = player->loadGeometry("a.obj");
    EXPECT_TRUE(handle.cancel());
    EXPECT_FALSE(handle.cancel());
    drain();

    EXPECT_EQ(handle.state(), player::LoadState::Cancelled);
    EXPECT_EQ(handle.result().error, player::LoadErrorKind::Cancelled);
    EXPECT_EQ(topLevelCount(), before);
    EXPECT_TRUE(loaded.empty());
    EXPECT_TRUE(failed.empty());
}

TEST_F(AssetLoadTest, CancelBetweenMaterialAndGeometry) {
    player::LoadHandle handle = player->loadGeometryWithMaterial("a.obj", "a.mtl");
    handle.cancel();
    drain();

    // the material loader already answered, but the geometry request is never made
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(loaded.empty());
}

TEST_F(AssetLoadTest, ConcurrentLoadsAreIndependent) {
    std::size_t before = topLevelCount();

    player::LoadHandle a = player->loadGeometry("a.obj");
    player::LoadHandle b = player->loadGeometry("b.obj");
    drain();

    EXPECT_EQ(a.state(), player::LoadState::Succeeded);
    EXPECT_EQ(b.state(), player::LoadState::Succeeded);
    EXPECT_NE(a.result().node, b.result().node);
    EXPECT_EQ(topLevelCount(), before + 2);
    EXPECT_EQ(loaded.size(), 2u);
}

TEST_F(AssetLoadTest, DestroyingPlayerCancelsLoads) {
    player::LoadHandle handle = player->loadGeometry("a.obj");
    player.reset();
    drain();

    EXPECT_EQ(handle.state(), player::LoadState::Cancelled);
    EXPECT_TRUE(loaded.empty());
}

TEST(LoadHandle, EmptyHandle) {
    player::LoadHandle handle;
    EXPECT_FALSE(handle.valid());
    EXPECT_FALSE(handle.cancel());
    EXPECT_THROW(handle.state(), std::logic_error);
}

} // namespace
