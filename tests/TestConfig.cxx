#include <gtest/gtest.h>

#include <stdexcept>

#include "player/Config.hxx"

namespace {

TEST(PlayerConfig, DefaultsAreValid) {
    player::PlayerConfig config;
    EXPECT_NO_THROW(config.validate());

    EXPECT_DOUBLE_EQ(config.aspectRatio, 16.0 / 9.0);
    EXPECT_DOUBLE_EQ(config.targetFrameRate, 25.0);
    EXPECT_DOUBLE_EQ(config.camera.fov, 45.0);
    EXPECT_DOUBLE_EQ(config.camera.distance, 250.0);
    EXPECT_EQ(config.lighting.ambientColor, 0xccccccu);
    EXPECT_FLOAT_EQ(config.lighting.ambientIntensity, 0.4f);
    EXPECT_DOUBLE_EQ(config.controls.rotateSpeed, 5.0);
    EXPECT_DOUBLE_EQ(config.controls.zoomSpeed, 3.2);
    EXPECT_DOUBLE_EQ(config.controls.panSpeed, 0.8);
    EXPECT_TRUE(config.controls.noPan);
    EXPECT_FALSE(config.controls.noZoom);
}

TEST(PlayerConfig, ValidateRejectsBadValues) {
    player::PlayerConfig config;
    config.aspectRatio = 0.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = player::PlayerConfig();
    config.targetFrameRate = -1.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = player::PlayerConfig();
    config.camera.near = 3000.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = player::PlayerConfig();
    config.camera.fov = 180.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = player::PlayerConfig();
    config.controls.dynamicDampingFactor = 1.5;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ParseAspect, AcceptsRatiosAndDecimals) {
    EXPECT_DOUBLE_EQ(player::parseAspect("16:9"), 16.0 / 9.0);
    EXPECT_DOUBLE_EQ(player::parseAspect("4:3"), 4.0 / 3.0);
    EXPECT_DOUBLE_EQ(player::parseAspect("1.5"), 1.5);
}

TEST(ParseAspect, RejectsGarbage) {
    EXPECT_THROW(player::parseAspect(""), std::invalid_argument);
    EXPECT_THROW(player::parseAspect("wide"), std::invalid_argument);
    EXPECT_THROW(player::parseAspect("16:0"), std::invalid_argument);
    EXPECT_THROW(player::parseAspect("16:9x"), std::invalid_argument);
    EXPECT_THROW(player::parseAspect("-2"), std::invalid_argument);
}

} // namespace
