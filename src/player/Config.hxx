#pragma once

#include <string>

namespace player {

struct CameraConfig {
    double fov = 45.0;
    double near = 1.0;
    double far = 2500.0;
    double distance = 250.0; // initial position along +Z
};

struct LightingConfig {
    unsigned int ambientColor = 0xcccccc;
    float ambientIntensity = 0.4f;
    unsigned int pointColor = 0xffffff;
    float pointIntensity = 0.8f;
};

struct ControlsConfig {
    double rotateSpeed = 5.0;
    double zoomSpeed = 3.2;
    double panSpeed = 0.8;
    bool noZoom = false;
    bool noPan = true;
    bool staticMoving = false;
    double dynamicDampingFactor = 0.2;
};

struct PlayerConfig {
    double aspectRatio = 16.0 / 9.0;
    double targetFrameRate = 25.0;
    double pixelRatio = 1.0;
    CameraConfig camera;
    LightingConfig lighting;
    ControlsConfig controls;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

// "16:9", "4:3" or a plain ratio such as "1.5". Throws std::invalid_argument.
double parseAspect(const std::string &text);

} // namespace player
