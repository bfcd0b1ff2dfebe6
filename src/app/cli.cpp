#include "app/cli.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>

namespace screenier {

static void printUsage(const char* exe) {
    std::cerr << "Usage: " << exe << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --backend <mode>         Capture backend: auto|x11 "
                 "(default: auto)\n"
              << "  --list-monitors          List displays visible to the "
                 "backend\n"
              << "  --no-animate             Capture a single frame, ignore "
                 "the hold key\n"
              << "  --retry-threshold <n>    Not-ready polls per display "
                 "before reusing its previous frame (default: 20)\n"
              << "  --debug                  Enable debug logging\n"
              << "  --help, -h               Show this help message\n"
              << "\n"
              << "Hotkeys:\n"
              << "  Hold Shift while capturing: keep recording frames\n";
}

static bool parseNonNegative(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < 0 || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

std::string backendKindToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::Auto:
            return "auto";
        case BackendKind::X11:
            return "x11";
    }
    return "auto";
}

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--backend") {
            if (i + 1 >= argc) {
                err = "--backend requires a value";
                return false;
            }
            std::string val = argv[++i];
            if (val == "auto") {
                out.backend = BackendKind::Auto;
            } else if (val == "x11") {
                out.backend = BackendKind::X11;
            } else {
                err = "unknown backend: " + val;
                return false;
            }
        } else if (arg == "--retry-threshold") {
            if (i + 1 >= argc) {
                err = "--retry-threshold requires a value";
                return false;
            }
            std::string val = argv[++i];
            if (!parseNonNegative(val, out.retryThreshold)) {
                err = "invalid retry threshold: " + val;
                return false;
            }
        } else if (arg == "--list-monitors") {
            out.listMonitors = true;
        } else if (arg == "--no-animate") {
            out.noAnimate = true;
        } else if (arg == "--debug") {
            out.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            std::exit(0);
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

CaptureConfig captureConfigFromCli(const CliOptions& options) {
    CaptureConfig config;
    config.notReadyRetryThreshold = options.retryThreshold;
    config.debug = options.debug;
    return config;
}

}  // namespace screenier
