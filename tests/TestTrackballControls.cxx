#include <gtest/gtest.h>

#include <cmath>

#include "Fakes.hxx"

#include "player/TrackballControls.hxx"

namespace {

double angleBetween(const Eigen::Vector3d &a, const Eigen::Vector3d &b) {
    double c = a.normalized().dot(b.normalized());
    return std::acos(std::max(-1.0, std::min(1.0, c)));
}

class TrackballTest : public ::testing::Test {
 protected:
    fakes::FakeContainer container{1600.0};
    scene::PerspectiveCamera camera{45.0, 16.0 / 9.0, 1.0, 2500.0};
    std::unique_ptr<player::TrackballControls> controls;

    void SetUp() override {
        container.setHeight(900.0);
        camera.position = Eigen::Vector3d(0, 0, 250);
        controls = std::make_unique<player::TrackballControls>(camera, &container);
    }

    // Primary drag from the center by `dx` pixels to the right.
    void dragRight(double dx) {
        container.firePointerDown(player::PointerButton::Primary, 800.0, 450.0);
        container.firePointerMove(800.0 + dx, 450.0);
    }
};

TEST_F(TrackballTest, RegistersWithContainer) {
    EXPECT_EQ(container.listenerCount(), 1u);
    controls.reset();
    EXPECT_EQ(container.listenerCount(), 0u);
}

TEST_F(TrackballTest, UpdateWithoutInputKeepsCamera) {
    controls->update();
    EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d(0, 0, 250)));
}

TEST_F(TrackballTest, DragRotatesAroundTarget) {
    controls->configure(player::ControlsConfig());
    dragRight(100.0);
    EXPECT_EQ(controls->state(), player::TrackballControls::State::Rotate);

    Eigen::Vector3d before = camera.position;
    controls->update();

    EXPECT_NEAR(camera.position.norm(), 250.0, 1e-9);
    EXPECT_GT(std::fabs(camera.position.x()), 1.0);
    // 100 px of an 800 px half-width, times rotateSpeed 5
    EXPECT_NEAR(angleBetween(before, camera.position), 0.625, 1e-9);
}

TEST_F(TrackballTest, RotationDecaysAfterRelease) {
    controls->configure(player::ControlsConfig());
    dragRight(100.0);
    Eigen::Vector3d p0 = camera.position;
    controls->update();
    Eigen::Vector3d p1 = camera.position;

    container.firePointerUp(player::PointerButton::Primary);
    EXPECT_EQ(controls->state(), player::TrackballControls::State::None);

    controls->update();
    Eigen::Vector3d p2 = camera.position;

    double first = angleBetween(p0, p1);
    double second = angleBetween(p1, p2);
    EXPECT_NEAR(second, first * std::sqrt(1.0 - 0.2), 1e-6);
}

TEST_F(TrackballTest, StaticMovingStopsImmediately) {
    player::ControlsConfig config;
    config.staticMoving = true;
    controls->configure(config);

    dragRight(100.0);
    controls->update();
    Eigen::Vector3d p1 = camera.position;

    container.firePointerUp(player::PointerButton::Primary);
    controls->update();
    EXPECT_TRUE(camera.position.isApprox(p1));
}

TEST_F(TrackballTest, WheelZoomsIn) {
    controls->configure(player::ControlsConfig());
    container.fireWheel(1.0);
    controls->update();

    EXPECT_NEAR(camera.position.norm(), 250.0 * (1.0 - 0.01 * 3.2), 1e-9);

    // the remaining zoom keeps easing in on later updates
    double d1 = camera.position.norm();
    controls->update();
    EXPECT_LT(camera.position.norm(), d1);
}

TEST_F(TrackballTest, NoZoomIgnoresWheel) {
    player::ControlsConfig config;
    config.noZoom = true;
    controls->configure(config);

    container.fireWheel(5.0);
    controls->update();
    EXPECT_NEAR(camera.position.norm(), 250.0, 1e-9);
}

TEST_F(TrackballTest, DisabledControlsIgnoreInput) {
    controls->enabled = false;
    dragRight(100.0);
    EXPECT_EQ(controls->state(), player::TrackballControls::State::None);
    controls->update();
    EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d(0, 0, 250)));
}

TEST_F(TrackballTest, PanMovesTargetWithCamera) {
    player::ControlsConfig config;
    config.noPan = false;
    config.staticMoving = true;
    controls->configure(config);

    container.firePointerDown(player::PointerButton::Secondary, 800.0, 450.0);
    container.firePointerMove(900.0, 450.0);
    controls->update();

    Eigen::Vector3d offset = camera.position - controls->target;
    EXPECT_GT(controls->target.norm(), 0.0);
    EXPECT_TRUE(offset.isApprox(Eigen::Vector3d(0, 0, 250)));
}

TEST_F(TrackballTest, ResetRestoresInitialState) {
    controls->configure(player::ControlsConfig());
    dragRight(200.0);
    controls->update();
    container.fireWheel(3.0);
    controls->update();
    controls->target = Eigen::Vector3d(1, 2, 3);

    controls->reset();

    EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d(0, 0, 250)));
    EXPECT_TRUE(camera.up.isApprox(Eigen::Vector3d::UnitY()));
    EXPECT_TRUE(controls->target.isZero());
    EXPECT_EQ(controls->state(), player::TrackballControls::State::None);

    // no leftover momentum
    controls->update();
    EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d(0, 0, 250)));
}

TEST_F(TrackballTest, DistanceLimits) {
    controls->configure(player::ControlsConfig());
    controls->minDistance = 245.0;
    container.fireWheel(10.0);
    controls->update();
    EXPECT_NEAR(camera.position.norm(), 245.0, 1e-9);
}

} // namespace
