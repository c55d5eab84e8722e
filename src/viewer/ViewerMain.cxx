// Player3D executable: one GLFW window hosting a Player.

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "viewer/GlfwContainer.hxx"
#include "viewer/Render.hxx"

#include "player/Config.hxx"
#include "player/EventLoop.hxx"
#include "player/LoadResult.hxx"
#include "player/Loaders.hxx"
#include "player/Log.hxx"
#include "player/Player.hxx"

namespace {

struct Options {
    std::string model;
    std::string material;
    int width = 1200;
    player::PlayerConfig config;
};

void usage() {
    std::cerr << "Usage: Player3D <model.obj> [--mtl <file.mtl>] [--width N] [--fps N] [--aspect W:H]\n";
}

// Throws std::invalid_argument on a malformed or incomplete command line.
Options parseArgs(int argc, char **argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--mtl") {
            opts.material = value();
        } else if (arg == "--width") {
            opts.width = std::stoi(value());
            if (opts.width <= 0) throw std::invalid_argument("--width must be positive");
        } else if (arg == "--fps") {
            opts.config.targetFrameRate = std::stod(value());
        } else if (arg == "--aspect") {
            opts.config.aspectRatio = player::parseAspect(value());
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (opts.model.empty()) {
            opts.model = arg;
        } else {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }
    if (opts.model.empty()) {
        throw std::invalid_argument("no model given");
    }
    opts.config.validate();
    return opts;
}

} // namespace

int main(int argc, char **argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception &e) {
        std::cerr << "[Player3D] " << e.what() << "\n";
        usage();
        return 1;
    }

    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW\n";
        return 3;
    }

    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    glfwWindowHint(GLFW_SAMPLES, 8);
    // Hidden until the player shows it.
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_COCOA_RETINA_FRAMEBUFFER, GLFW_TRUE);
#endif

    int initialHeight = std::max(1, static_cast<int>(std::lround(opts.width / opts.config.aspectRatio)));
    GLFWwindow *window = glfwCreateWindow(opts.width, initialHeight, "Player3D", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        std::cerr << "Failed to create window\n";
        return 4;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    glEnable(GL_MULTISAMPLE);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    float xscale = 1.0f, yscale = 1.0f;
    glfwGetWindowContentScale(window, &xscale, &yscale);
    opts.config.pixelRatio = xscale > 0.0f ? xscale : 1.0f;

    player::EventLoop loop;
    player::Log log("Player3D");

    viewer::Console console;
    console.setMaxLines(8);
    log.addSink(&console);

    int status = 0;
    {
        viewer::GlfwContainer container(window);

        player::PlayerServices services;
        services.renderer = std::make_unique<viewer::GLRenderer>(window, &console);
        services.geometryLoader = std::make_unique<player::ObjLoader>(loop);
        services.materialLoader = std::make_unique<player::MtlLoader>(loop);

        try {
            player::Player player(loop, std::move(services), opts.config, &log);

            player.events().subscribe(player::kLoaded, [&log](const player::Event &) { log("Viewer ready"); });
            player.events().subscribe(player::kModelLoaded, [&log](const player::Event &e) {
                log("Showing", e.result->url);
            });
            player.events().subscribe(player::kModelLoadFailed, [&log](const player::Event &e) {
                log("Could not load", e.result->url, "-", player::toString(e.result->error));
            });

            player.initialize(&container);
            player.start();
            player.show();

            player::LoadHandle handle = opts.material.empty()
                                            ? player.loadGeometry(opts.model)
                                            : player.loadGeometryWithMaterial(opts.model, opts.material);

            bool spaceWasDown = false;
            bool rWasDown = false;

            while (!glfwWindowShouldClose(window)) {
                loop.runPending();
                loop.runFrame();

                if (loop.hasImmediate() || loop.frameRequestCount() > 0) {
                    glfwPollEvents();
                } else {
                    double wait = loop.timeUntilNextTimer();
                    glfwWaitEventsTimeout(wait < 0.0 ? 0.1 : wait / 1000.0);
                }

                // Space pauses/resumes rendering, R resets the camera (edge-triggered)
                bool spaceDown = (glfwGetKey(window, GLFW_KEY_SPACE) == GLFW_PRESS);
                if (spaceDown && !spaceWasDown) {
                    if (player.renderLoop().running()) {
                        player.stop();
                        log("Paused");
                    } else {
                        player.start();
                        log("Resumed");
                    }
                }
                spaceWasDown = spaceDown;

                bool rDown = (glfwGetKey(window, GLFW_KEY_R) == GLFW_PRESS);
                if (rDown && !rWasDown) {
                    player.controls().reset();
                }
                rWasDown = rDown;

                if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS ||
                    glfwGetKey(window, GLFW_KEY_Q) == GLFW_PRESS) {
                    glfwSetWindowShouldClose(window, 1);
                }
            }

            if (handle.done() && handle.state() != player::LoadState::Succeeded) {
                status = 2;
            }
            player.stop();
        } catch (const player::PlayerError &e) {
            std::cerr << "[Player3D] " << e.what() << "\n";
            status = 5;
        } catch (const std::invalid_argument &e) {
            std::cerr << "[Player3D] " << e.what() << "\n";
            status = 1;
        }

        log.removeSink(&console);
        container.detach();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return status;
}
