#include "viewer/GlfwContainer.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace viewer {

static player::PointerButton toPointerButton(int button) {
    switch (button) {
        case GLFW_MOUSE_BUTTON_MIDDLE: return player::PointerButton::Middle;
        case GLFW_MOUSE_BUTTON_RIGHT: return player::PointerButton::Secondary;
        default: return player::PointerButton::Primary;
    }
}

GlfwContainer::GlfwContainer(GLFWwindow *window) : window_(window) {
    if (!window_) {
        throw std::invalid_argument("GlfwContainer: null window");
    }
    installCallbacks();
}

GlfwContainer::~GlfwContainer() {
    detach();
}

double GlfwContainer::width() const {
    if (!window_) return 0.0;
    int w = 0, h = 0;
    glfwGetWindowSize(window_, &w, &h);
    return static_cast<double>(w);
}

double GlfwContainer::height() const {
    if (!window_) return 0.0;
    int w = 0, h = 0;
    glfwGetWindowSize(window_, &w, &h);
    return static_cast<double>(h);
}

void GlfwContainer::setHeight(double height) {
    if (!window_) return;
    int w = 0, h = 0;
    glfwGetWindowSize(window_, &w, &h);
    int target = std::max(1, static_cast<int>(std::lround(height)));
    if (target != h) {
        // Processed asynchronously; the resulting size event re-derives the same height.
        glfwSetWindowSize(window_, w, target);
    }
}

bool GlfwContainer::visible() const {
    return window_ && glfwGetWindowAttrib(window_, GLFW_VISIBLE) == GLFW_TRUE;
}

void GlfwContainer::setVisible(bool visible) {
    if (!window_) return;
    if (visible) {
        glfwShowWindow(window_);
    } else {
        glfwHideWindow(window_);
    }
}

void GlfwContainer::clear() {
    surface_ = nullptr;
}

void GlfwContainer::attach(player::Renderer &renderer) {
    if (!window_) return;
    glfwMakeContextCurrent(window_);
    surface_ = &renderer;
}

void GlfwContainer::addInputListener(player::InputListener *listener) {
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void GlfwContainer::removeInputListener(player::InputListener *listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void GlfwContainer::detach() {
    if (!window_) return;
    glfwSetWindowSizeCallback(window_, nullptr);
    glfwSetMouseButtonCallback(window_, nullptr);
    glfwSetCursorPosCallback(window_, nullptr);
    glfwSetScrollCallback(window_, nullptr);
    glfwSetWindowUserPointer(window_, nullptr);
    window_ = nullptr;
    surface_ = nullptr;
}

void GlfwContainer::installCallbacks() {
    glfwSetWindowUserPointer(window_, this);

    glfwSetWindowSizeCallback(window_, [](GLFWwindow *win, int /*w*/, int /*h*/) {
        auto *self = reinterpret_cast<GlfwContainer *>(glfwGetWindowUserPointer(win));
        if (!self) return;
        self->dispatch([](player::InputListener &l) { l.onResize(); });
    });

    glfwSetMouseButtonCallback(window_, [](GLFWwindow *win, int button, int action, int /*mods*/) {
        auto *self = reinterpret_cast<GlfwContainer *>(glfwGetWindowUserPointer(win));
        if (!self) return;
        player::PointerButton b = toPointerButton(button);
        if (action == GLFW_PRESS) {
            double x, y;
            glfwGetCursorPos(win, &x, &y);
            self->dispatch([b, x, y](player::InputListener &l) { l.onPointerDown(b, x, y); });
        } else if (action == GLFW_RELEASE) {
            self->dispatch([b](player::InputListener &l) { l.onPointerUp(b); });
        }
    });

    glfwSetCursorPosCallback(window_, [](GLFWwindow *win, double x, double y) {
        auto *self = reinterpret_cast<GlfwContainer *>(glfwGetWindowUserPointer(win));
        if (!self) return;
        self->dispatch([x, y](player::InputListener &l) { l.onPointerMove(x, y); });
    });

    glfwSetScrollCallback(window_, [](GLFWwindow *win, double /*xoff*/, double yoff) {
        auto *self = reinterpret_cast<GlfwContainer *>(glfwGetWindowUserPointer(win));
        if (!self) return;
        // scroll up => positive, zooms in
        self->dispatch([yoff](player::InputListener &l) { l.onWheel(yoff); });
    });
}

} // namespace viewer
