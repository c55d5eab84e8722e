#ifndef __PARSEERROR_HXX__
#define __PARSEERROR_HXX__

#include <stdexcept>
#include <string>

namespace scene {

// Malformed OBJ/MTL input. `line()` is 1-based, 0 when not tied to a line.
class ParseError : public std::runtime_error {
 public:
    ParseError(const std::string &source, int line, const std::string &what)
        : std::runtime_error(source + ":" + std::to_string(line) + ": " + what), line_(line) {}

    int line() const { return line_; }

 private:
    int line_;
};

} // namespace scene

#endif // __PARSEERROR_HXX__
