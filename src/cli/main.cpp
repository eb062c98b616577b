/**
 * hostbridge CLI
 *
 * Command-line interface for running compiled guest modules.
 *
 * Usage:
 *   hostbridge run <module.wasm>               Run a guest module
 *   hostbridge --version                       Show version information
 *   hostbridge --help                          Show help
 */

#include "hostbridge/runtime.h"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

void printVersion() {
    std::cout << "hostbridge v" << hostbridge::getVersion() << std::endl;
    std::cout << "Native host for sandboxed guests - SDL3 + OpenGL ES + libuv/curl build" << std::endl;
}

void printHelp() {
    std::cout << R"(
hostbridge - Native host for compiled guest modules

USAGE:
    hostbridge run <module.wasm> [options]    Run a guest module
    hostbridge --version                      Show version information
    hostbridge --help                         Show this help message

RUN OPTIONS:
    --width <n>           Window width (default: 800)
    --height <n>          Window height (default: 600)
    --title <str>         Window title (default: "hostbridge")
    --fullscreen          Start fullscreen
    --high-dpi            Render at the display's pixel density
    --gl <1|2>            Graphics profile: 1 = OpenGL ES 2.0 + extensions,
                          2 = OpenGL ES 3.0 (default: 1)
    --stereo-audio        Use the panned stereo voice graph instead of the
                          pooled single-gain voices
    --transpile-shaders   Rewrite guest shaders to the context's dialect even
                          if the guest does not ask for it
    --headless            Run with hidden window (background mode)
    --debug               Verbose logging, including guest debug output

HEADLESS MODE:
    hostbridge run game.wasm --headless
    HOSTBRIDGE_HEADLESS=1 hostbridge run game.wasm

    The window and GL context are still created, only hidden.

EXAMPLES:
    hostbridge run game.wasm                                 # Run interactively
    hostbridge run game.wasm --width 1920 --height 1080      # Custom size
    hostbridge run game.wasm --gl 2 --high-dpi               # GLES 3.0, native density

ENVIRONMENT:
    HOSTBRIDGE_HEADLESS=1     Run in headless mode (hidden window)

)" << std::endl;
}

struct CLIOptions {
    std::string command;
    std::string modulePath;
    int width = 800;
    int height = 600;
    std::string title = "hostbridge";
    bool fullscreen = false;
    bool highDpi = false;
    int glVersion = 1;
    bool stereoAudio = false;
    bool transpileShaders = false;
    bool headless = false;
    bool debug = false;
    bool showHelp = false;
    bool showVersion = false;
    std::string error;
};

namespace {

bool parseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    return value && std::string(value) == "1";
}

}  // namespace

CLIOptions parseArgs(int argc, char* argv[]) {
    CLIOptions opts;

    for (int i = 1; i < argc && opts.error.empty(); i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else if (arg == "--version" || arg == "-v") {
            opts.showVersion = true;
        } else if (arg == "--width" && i + 1 < argc) {
            if (!parseInt(argv[++i], opts.width) || opts.width <= 0) {
                opts.error = "Invalid --width value";
            }
        } else if (arg == "--height" && i + 1 < argc) {
            if (!parseInt(argv[++i], opts.height) || opts.height <= 0) {
                opts.error = "Invalid --height value";
            }
        } else if (arg == "--title" && i + 1 < argc) {
            opts.title = argv[++i];
        } else if (arg == "--fullscreen") {
            opts.fullscreen = true;
        } else if (arg == "--high-dpi") {
            opts.highDpi = true;
        } else if (arg == "--gl" && i + 1 < argc) {
            if (!parseInt(argv[++i], opts.glVersion) || (opts.glVersion != 1 && opts.glVersion != 2)) {
                opts.error = "--gl must be 1 or 2";
            }
        } else if (arg == "--stereo-audio") {
            opts.stereoAudio = true;
        } else if (arg == "--transpile-shaders") {
            opts.transpileShaders = true;
        } else if (arg == "--headless") {
            opts.headless = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "run" && opts.command.empty()) {
            opts.command = "run";
        } else if (opts.command == "run" && opts.modulePath.empty() && (arg.empty() || arg[0] != '-')) {
            opts.modulePath = arg;
        } else {
            opts.error = "Unknown argument: " + arg;
        }
    }

    if (envFlag("HOSTBRIDGE_HEADLESS")) {
        opts.headless = true;
    }

    return opts;
}

int runModule(const CLIOptions& opts) {
    std::cout << "=== hostbridge ===" << std::endl;
    std::cout << "Version: " << hostbridge::getVersion() << std::endl;
    std::cout << "Module: " << opts.modulePath << std::endl;
    std::cout << "Window: " << opts.width << "x" << opts.height << std::endl;
    if (opts.headless) {
        std::cout << "Headless: window hidden" << std::endl;
    }
    std::cout << std::endl;

    hostbridge::RuntimeConfig config;
    config.width = opts.width;
    config.height = opts.height;
    config.title = opts.title;
    config.fullscreen = opts.fullscreen;
    config.highDpi = opts.highDpi;
    config.glVersion = opts.glVersion;
    config.audioVariant =
        opts.stereoAudio ? hostbridge::audio::AudioVariant::StereoPanned : hostbridge::audio::AudioVariant::Pooled;
    config.transpileShaders = opts.transpileShaders;
    config.headless = opts.headless;
    config.debug = opts.debug;

    auto runtime = hostbridge::Runtime::create(config);
    if (!runtime) {
        std::cerr << "Error: Failed to create runtime!" << std::endl;
        return 1;
    }

    if (!runtime->loadModule(opts.modulePath)) {
        std::cerr << "Error: Failed to load guest module!" << std::endl;
        return 1;
    }

    runtime->run();
    return 0;
}

int main(int argc, char* argv[]) {
    CLIOptions opts = parseArgs(argc, argv);

    if (opts.showVersion) {
        printVersion();
        return 0;
    }

    if (opts.showHelp) {
        printHelp();
        return 0;
    }

    if (!opts.error.empty()) {
        std::cerr << "Error: " << opts.error << std::endl;
        printHelp();
        return 1;
    }

    if (opts.command.empty()) {
        printHelp();
        return 1;
    }

    if (opts.command == "run") {
        if (opts.modulePath.empty()) {
            std::cerr << "Error: No module file specified." << std::endl;
            std::cerr << "Usage: hostbridge run <module.wasm>" << std::endl;
            return 1;
        }
        return runModule(opts);
    }

    std::cerr << "Error: Unknown command or missing arguments." << std::endl;
    printHelp();
    return 1;
}
