#pragma once

#include <memory>
#include <string>
#include <utility>

namespace scene {
class Object3D;
}

namespace player {

enum class LoadErrorKind {
    NotFound,
    Io,
    Parse,
    UnsupportedScheme,
    Cancelled,
};

const char *toString(LoadErrorKind kind);

// Reported by loaders through their error callback.
struct LoadError {
    LoadErrorKind kind;
    std::string url;
    std::string message;
};

// Outcome of one load request: Success(node) | Failure(kind, message).
struct LoadResult {
    bool success = false;
    std::string url;         // geometry url
    std::string materialUrl; // empty for geometry-only loads

    scene::Object3D *node = nullptr; // owned by the scene graph, valid while the player lives

    LoadErrorKind error = LoadErrorKind::Io;
    std::string message;

    static LoadResult succeeded(std::string url, std::string materialUrl, scene::Object3D *node);
    static LoadResult failed(std::string url, std::string materialUrl, LoadErrorKind kind, std::string message);
};

enum class LoadState { Pending, Succeeded, Failed, Cancelled };

// Shared state between a running load and its handle.
class LoadTask {
 public:
    LoadTask(std::string url, std::string materialUrl);

    LoadState state() const { return state_; }
    bool pending() const { return state_ == LoadState::Pending; }

    // Pending -> Succeeded/Failed. Ignored once settled.
    void settle(LoadResult result);

    // Pending -> Cancelled. Returns false if already settled.
    bool cancel();

    const LoadResult &result() const { return result_; }

 private:
    LoadState state_ = LoadState::Pending;
    LoadResult result_;
};

// Caller's view of an in-flight load.
class LoadHandle {
 public:
    LoadHandle() = default;
    explicit LoadHandle(std::shared_ptr<LoadTask> task) : task_(std::move(task)) {}

    bool valid() const { return static_cast<bool>(task_); }
    LoadState state() const;
    bool done() const { return state() != LoadState::Pending; }

    // Discards the result of a pending load; nothing is inserted and no event fires.
    bool cancel();

    // Throws std::logic_error while the load is pending.
    const LoadResult &result() const;

 private:
    std::shared_ptr<LoadTask> task_;
};

} // namespace player
