#pragma once

namespace player {

class Renderer;

enum class PointerButton { Primary = 0, Middle = 1, Secondary = 2 };

// Input delivered by a Container. Coordinates are in container pixels,
// origin at the top-left corner.
class InputListener {
 public:
    virtual ~InputListener() = default;

    virtual void onResize() {}
    virtual void onPointerMove(double /*x*/, double /*y*/) {}
    virtual void onPointerDown(PointerButton /*button*/, double /*x*/, double /*y*/) {}
    virtual void onPointerUp(PointerButton /*button*/) {}
    virtual void onWheel(double /*delta*/) {} // positive: away from the user
};

// Region of the host that the player draws into: a window on the desktop.
// Its width is chosen by the host; its height is set by the player.
class Container {
 public:
    virtual ~Container() = default;

    // False once the underlying host object is gone.
    virtual bool attached() const = 0;

    virtual double width() const = 0;
    virtual double height() const = 0;
    virtual void setHeight(double height) = 0;

    virtual bool visible() const = 0;
    virtual void setVisible(bool visible) = 0;

    // Detach every output surface, then attach `renderer`'s.
    virtual void clear() = 0;
    virtual void attach(Renderer &renderer) = 0;

    virtual void addInputListener(InputListener *listener) = 0;
    virtual void removeInputListener(InputListener *listener) = 0;
};

} // namespace player
