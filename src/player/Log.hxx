#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace player {

// Receives every line written through a Log (e.g. the on-screen console).
class LogSink {
 public:
    virtual ~LogSink() = default;
    virtual void log(const std::string &line) = 0;
};

// Tagged line logger: `[Tag] arg1 arg2 ...` to a stream plus any attached sinks.
class Log {
 public:
    explicit Log(std::string tag, std::ostream &out = std::cerr);

    template <typename... Args>
    void operator()(const Args &...args) {
        std::ostringstream oss;
        oss << "[" << tag_ << "]";
        ((oss << ' ' << args), ...);
        write(oss.str());
    }

    void addSink(LogSink *sink);
    void removeSink(LogSink *sink);

    const std::string &tag() const { return tag_; }

 private:
    std::string tag_;
    std::ostream &out_;
    std::vector<LogSink *> sinks_;

    void write(const std::string &line);
};

} // namespace player
