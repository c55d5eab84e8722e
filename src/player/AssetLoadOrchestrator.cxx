#include "player/AssetLoadOrchestrator.hxx"

#include <algorithm>
#include <utility>

namespace player {

AssetLoadOrchestrator::AssetLoadOrchestrator(scene::Scene &scene, TrackballControls &controls,
                                             EventChannel &events, GeometryLoader &geometryLoader,
                                             MaterialLoader &materialLoader, Log &log)
    : scene_(scene),
      controls_(controls),
      events_(events),
      geometryLoader_(geometryLoader),
      materialLoader_(materialLoader),
      log_(log),
      manager_(log) {}

AssetLoadOrchestrator::~AssetLoadOrchestrator() {
    // Loader callbacks check their task before touching `this`.
    cancelAll();
}

std::shared_ptr<LoadTask> AssetLoadOrchestrator::track(const std::string &url, const std::string &materialUrl) {
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::weak_ptr<LoadTask> &w) {
                                    auto t = w.lock();
                                    return !t || !t->pending();
                                }),
                 tasks_.end());

    auto task = std::make_shared<LoadTask>(url, materialUrl);
    tasks_.push_back(task);
    return task;
}

LoadHandle AssetLoadOrchestrator::loadGeometry(const std::string &url) {
    auto task = track(url, "");
    fetchGeometry(task, nullptr);
    return LoadHandle(task);
}

LoadHandle AssetLoadOrchestrator::loadGeometryWithMaterial(const std::string &geometryUrl,
                                                          const std::string &materialUrl) {
    auto task = track(geometryUrl, materialUrl);

    ProgressCallback progress = manager_.onProgress();
    materialLoader_.load(
        materialUrl,
        [this, task](std::shared_ptr<scene::MaterialSet> materials) {
            if (!task->pending()) return;
            if (!materials) {
                fail(task, LoadError{LoadErrorKind::Parse, task->result().materialUrl, "loader returned no materials"});
                return;
            }
            try {
                materials->preload();
            } catch (const std::exception &e) {
                fail(task, LoadError{LoadErrorKind::Parse, task->result().materialUrl, e.what()});
                return;
            }
            log_("Materials ready:", materials->size(), "from", task->result().materialUrl);
            fetchGeometry(task, std::move(materials));
        },
        [task, progress](const LoadProgress &p) {
            if (task->pending()) progress(p);
        },
        [this, task](const LoadError &e) {
            if (!task->pending()) return;
            fail(task, e);
        });

    return LoadHandle(task);
}

void AssetLoadOrchestrator::fetchGeometry(const std::shared_ptr<LoadTask> &task,
                                          std::shared_ptr<scene::MaterialSet> materials) {
    ProgressCallback progress = manager_.onProgress();
    geometryLoader_.load(
        task->result().url, std::move(materials),
        [this, task](std::unique_ptr<scene::Group> object) {
            if (!task->pending()) return;
            if (!object) {
                fail(task, LoadError{LoadErrorKind::Parse, task->result().url, "loader returned no object"});
                return;
            }
            place(task, std::move(object));
        },
        [task, progress](const LoadProgress &p) {
            if (task->pending()) progress(p);
        },
        [this, task](const LoadError &e) {
            if (!task->pending()) return;
            fail(task, e);
        });
}

void AssetLoadOrchestrator::place(const std::shared_ptr<LoadTask> &task, std::unique_ptr<scene::Group> object) {
    // Center vertically on the origin; the box is taken before insertion, in the object's own frame.
    scene::Box3 box = scene::computeBoundingBox(*object);
    if (!box.isEmpty()) {
        object->position.y() -= box.center().y();
    }

    scene::Object3D &node = scene_.add(std::move(object));
    controls_.reset();

    std::string url = task->result().url;
    std::string materialUrl = task->result().materialUrl;
    task->settle(LoadResult::succeeded(url, materialUrl, &node));

    log_("Model loaded:", url);
    events_.emit(Event{kModelLoaded, &task->result()});
}

void AssetLoadOrchestrator::fail(const std::shared_ptr<LoadTask> &task, const LoadError &error) {
    manager_.onError()(error);

    std::string url = task->result().url;
    std::string materialUrl = task->result().materialUrl;
    task->settle(LoadResult::failed(url, materialUrl, error.kind, error.message));

    events_.emit(Event{kModelLoadFailed, &task->result()});
}

void AssetLoadOrchestrator::cancelAll() {
    for (auto &w : tasks_) {
        if (auto t = w.lock()) {
            t->cancel();
        }
    }
    tasks_.clear();
}

std::size_t AssetLoadOrchestrator::inFlight() const {
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const std::weak_ptr<LoadTask> &w) {
        auto t = w.lock();
        return t && t->pending();
    }));
}

} // namespace player
