#pragma once

#include <vector>

#include "viewer/GL.hxx"

#include "player/Container.hxx"
#include "player/Renderer.hxx"

namespace viewer {

// A GLFW window acting as the player's container. Window size and input
// callbacks are forwarded to the registered listeners.
// The window user pointer is claimed by this object.
class GlfwContainer : public player::Container {
 public:
    explicit GlfwContainer(GLFWwindow *window);
    ~GlfwContainer() override;

    GlfwContainer(const GlfwContainer &) = delete;
    GlfwContainer &operator=(const GlfwContainer &) = delete;

    bool attached() const override { return window_ != nullptr; }

    double width() const override;
    double height() const override;
    void setHeight(double height) override;

    bool visible() const override;
    void setVisible(bool visible) override;

    void clear() override;
    void attach(player::Renderer &renderer) override;

    void addInputListener(player::InputListener *listener) override;
    void removeInputListener(player::InputListener *listener) override;

    player::Renderer *surface() const { return surface_; }

    // Releases the window callbacks; the container reports detached afterwards.
    void detach();

    GLFWwindow *window() const { return window_; }

 private:
    GLFWwindow *window_;
    player::Renderer *surface_ = nullptr;
    std::vector<player::InputListener *> listeners_;

    void installCallbacks();

    template <typename Fn>
    void dispatch(Fn fn) {
        // Listeners may unregister themselves while handling an event.
        std::vector<player::InputListener *> copy = listeners_;
        for (player::InputListener *l : copy) {
            fn(*l);
        }
    }
};

} // namespace viewer
