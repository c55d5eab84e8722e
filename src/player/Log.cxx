#include "player/Log.hxx"

#include <algorithm>
#include <utility>

namespace player {

Log::Log(std::string tag, std::ostream &out) : tag_(std::move(tag)), out_(out) {}

void Log::addSink(LogSink *sink) {
    if (sink && std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
        sinks_.push_back(sink);
    }
}

void Log::removeSink(LogSink *sink) {
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Log::write(const std::string &line) {
    out_ << line << "\n";
    for (LogSink *s : sinks_) {
        s->log(line);
    }
}

} // namespace player
