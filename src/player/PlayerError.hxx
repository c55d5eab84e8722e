#pragma once

#include <stdexcept>
#include <string>

namespace player {

// Misuse of the Player lifecycle.
class PlayerError : public std::runtime_error {
 public:
    enum class Kind {
        InvalidContainer,   // null, detached or zero-width container
        NotInitialized,     // operation requires initialize() first
        AlreadyInitialized,
    };

    PlayerError(Kind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

 private:
    Kind kind_;
};

} // namespace player
