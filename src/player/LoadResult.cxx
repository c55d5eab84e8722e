#include "player/LoadResult.hxx"

#include <stdexcept>
#include <utility>

namespace player {

const char *toString(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::NotFound: return "not found";
        case LoadErrorKind::Io: return "i/o error";
        case LoadErrorKind::Parse: return "parse error";
        case LoadErrorKind::UnsupportedScheme: return "unsupported scheme";
        case LoadErrorKind::Cancelled: return "cancelled";
    }
    return "?";
}

LoadResult LoadResult::succeeded(std::string url, std::string materialUrl, scene::Object3D *node) {
    LoadResult r;
    r.success = true;
    r.url = std::move(url);
    r.materialUrl = std::move(materialUrl);
    r.node = node;
    return r;
}

LoadResult LoadResult::failed(std::string url, std::string materialUrl, LoadErrorKind kind, std::string message) {
    LoadResult r;
    r.success = false;
    r.url = std::move(url);
    r.materialUrl = std::move(materialUrl);
    r.error = kind;
    r.message = std::move(message);
    return r;
}

LoadTask::LoadTask(std::string url, std::string materialUrl) {
    result_.url = std::move(url);
    result_.materialUrl = std::move(materialUrl);
}

void LoadTask::settle(LoadResult result) {
    if (state_ != LoadState::Pending) return;
    state_ = result.success ? LoadState::Succeeded : LoadState::Failed;
    result_ = std::move(result);
}

bool LoadTask::cancel() {
    if (state_ != LoadState::Pending) return false;
    state_ = LoadState::Cancelled;
    result_.success = false;
    result_.error = LoadErrorKind::Cancelled;
    result_.message = "load cancelled";
    return true;
}

LoadState LoadHandle::state() const {
    if (!task_) {
        throw std::logic_error("LoadHandle: empty handle");
    }
    return task_->state();
}

bool LoadHandle::cancel() {
    return task_ && task_->cancel();
}

const LoadResult &LoadHandle::result() const {
    if (state() == LoadState::Pending) {
        throw std::logic_error("LoadHandle: load still pending");
    }
    return task_->result();
}

} // namespace player
