#pragma once

#include "viewer/GL.hxx"

#include <string>
#include <vector>

#include "player/Log.hxx"
#include "player/Renderer.hxx"

#include "scene/Camera.hxx"
#include "scene/Object3D.hxx"

namespace viewer {

// Simple on-screen console for displaying log messages
class Console : public player::LogSink {
public:
    // Add a message to the console
    void log(const std::string &msg) override;

    // Clear all messages
    void clear();

    // Draw the console at the top of the screen
    void draw(GLFWwindow *window, float startY = 20.0f) const;

    // Set maximum number of lines to display (default 10)
    void setMaxLines(int n) { maxLines_ = n; }

    const std::vector<std::string> &lines() const { return lines_; }

private:
    std::vector<std::string> lines_;
    int maxLines_ = 10;
};

// Draw simple text overlay in screen coordinates (top-left origin).
// Must be called with proper orthographic projection set up for screen space.
void drawTextOverlay(GLFWwindow *window, const char *text, float x, float y, float r, float g, float b);

// Fixed-function OpenGL renderer drawing into a GLFW window.
// Ambient lights feed the light model ambient term, point lights become
// GL_LIGHT0..7 at their world positions, meshes use their material colors.
class GLRenderer : public player::Renderer {
public:
    explicit GLRenderer(GLFWwindow *window, const Console *console = nullptr);

    void setPixelRatio(double ratio) override { pixelRatio_ = ratio; }
    void setSize(double width, double height) override;

    void render(const scene::Scene &scene, const scene::PerspectiveCamera &camera) override;

    void setClearColor(float r, float g, float b) { clear_[0] = r; clear_[1] = g; clear_[2] = b; }

private:
    GLFWwindow *window_;
    const Console *console_;
    double pixelRatio_ = 1.0;
    double width_ = 1.0;
    double height_ = 1.0;
    float clear_[3] = {0.1f, 0.1f, 0.12f};

    void setupLights(const scene::Scene &scene) const;
    void drawNode(const scene::Object3D &node) const;
};

} // namespace viewer
