#pragma once

namespace scene {
class Scene;
class PerspectiveCamera;
}

namespace player {

// Output surface plus the drawing of one frame.
class Renderer {
 public:
    virtual ~Renderer() = default;

    virtual void setPixelRatio(double ratio) = 0;

    // Logical size; the drawable is size * pixel ratio.
    virtual void setSize(double width, double height) = 0;

    virtual void render(const scene::Scene &scene, const scene::PerspectiveCamera &camera) = 0;
};

} // namespace player
