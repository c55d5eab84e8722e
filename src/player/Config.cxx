#include "player/Config.hxx"

#include <cmath>
#include <stdexcept>

namespace player {

void PlayerConfig::validate() const {
    if (!(aspectRatio > 0.0) || !std::isfinite(aspectRatio)) {
        throw std::invalid_argument("aspectRatio must be positive");
    }
    if (!(targetFrameRate > 0.0) || !std::isfinite(targetFrameRate)) {
        throw std::invalid_argument("targetFrameRate must be positive");
    }
    if (!(pixelRatio > 0.0)) {
        throw std::invalid_argument("pixelRatio must be positive");
    }
    if (!(camera.fov > 0.0 && camera.fov < 180.0)) {
        throw std::invalid_argument("camera.fov must be in (0, 180)");
    }
    if (!(camera.near > 0.0 && camera.near < camera.far)) {
        throw std::invalid_argument("camera.near must be positive and below camera.far");
    }
    if (!(controls.dynamicDampingFactor >= 0.0 && controls.dynamicDampingFactor <= 1.0)) {
        throw std::invalid_argument("controls.dynamicDampingFactor must be in [0, 1]");
    }
}

double parseAspect(const std::string &text) {
    double ratio = 0.0;
    try {
        std::size_t colon = text.find(':');
        if (colon == std::string::npos) {
            std::size_t used = 0;
            ratio = std::stod(text, &used);
            if (used != text.size()) ratio = 0.0;
        } else {
            std::size_t usedW = 0, usedH = 0;
            std::string ws = text.substr(0, colon);
            std::string hs = text.substr(colon + 1);
            double w = std::stod(ws, &usedW);
            double h = std::stod(hs, &usedH);
            if (usedW == ws.size() && usedH == hs.size() && h > 0.0) ratio = w / h;
        }
    } catch (const std::exception &) {
        ratio = 0.0;
    }
    if (!(ratio > 0.0) || !std::isfinite(ratio)) {
        throw std::invalid_argument("invalid aspect ratio '" + text + "'");
    }
    return ratio;
}

} // namespace player
