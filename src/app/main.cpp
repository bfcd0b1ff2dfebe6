#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/cli.hpp"
#include "capture/BackendFactory.hpp"
#include "capture/CaptureRun.hpp"
#include "platform/Log.hpp"
#include "platform/Time.hpp"

#if defined(SCREENIER_HAS_X11)
#include "input/X11HoldKey.hpp"
#endif

namespace screenier {

namespace {

void printMonitorList(const std::string& backendName,
                      const std::vector<MonitorInfo>& monitors) {
    std::cout << "Backend: " << backendName << "\n";
    if (monitors.empty()) {
        std::cout << "(no monitors reported)\n";
        return;
    }
    for (size_t i = 0; i < monitors.size(); ++i) {
        const auto& m = monitors[i];
        std::cout << "[" << i << "] " << m.name << " " << m.x << "," << m.y
                  << " " << m.w << "x" << m.h << " scale=" << m.scale;
        if (m.primary) {
            std::cout << " primary";
        }
        std::cout << "\n";
    }
}

std::unique_ptr<IHoldCondition> createHoldCondition() {
#if defined(SCREENIER_HAS_X11)
    return CreateX11HoldKey();
#else
    LOG_ERROR("X11 keyboard support disabled at build time");
    return nullptr;
#endif
}

void printStill(const StillCapture& still) {
    std::cout << "Captured " << still.image.w << "x" << still.image.h
              << " at " << still.originX << "," << still.originY << " from "
              << still.monitors.size() << " display(s)\n";
}

void printSequence(const FrameSequence& sequence) {
    const ImageRGBA& first = sequence.frames.front();
    std::cout << "Captured " << sequence.frames.size() << " frame(s) of "
              << first.w << "x" << first.h << " at " << sequence.originX << ","
              << sequence.originY << " from " << sequence.monitors.size()
              << " display(s)\n";
    std::cout << "Delays (ms):";
    for (auto delay : sequence.delaysMs) {
        std::cout << " " << delay;
    }
    std::cout << "\n";
}

}  // namespace

}  // namespace screenier

int main(int argc, char** argv) {
    using namespace screenier;

    initFileLogging();

    CliOptions options;
    std::string err;
    if (!parseCli(argc, argv, options, err)) {
        LOG_ERROR("%s", err.c_str());
        closeFileLogging();
        return 1;
    }

    setDebugLogging(options.debug);

    auto backend = CreateBackend(options.backend);
    if (!backend) {
        LOG_ERROR("failed to create backend");
        closeFileLogging();
        return 1;
    }

    if (!backend->isAvailable()) {
        if (options.backend == BackendKind::X11) {
            LOG_ERROR(
                "X11 backend unavailable (DISPLAY missing or access denied)");
        } else {
            LOG_ERROR("backend '%s' is not available", backend->name().c_str());
        }
        closeFileLogging();
        return 1;
    }

    if (options.listMonitors) {
        auto monitors = backend->listMonitors();
        printMonitorList(backend->name(), monitors);
        closeFileLogging();
        return 0;
    }

    CaptureConfig config = captureConfigFromCli(options);

    std::unique_ptr<IHoldCondition> hold;
    if (!options.noAnimate) {
        hold = createHoldCondition();
        if (!hold) {
            LOG_WARN("hold key unavailable, capturing a single frame");
        }
    }

    if (!hold) {
        StillCapture still;
        if (!captureStill(*backend, systemClock(), config, still, err)) {
            LOG_ERROR("capture failed on backend '%s': %s",
                      backend->name().c_str(), err.c_str());
            closeFileLogging();
            return 1;
        }
        printStill(still);
        closeFileLogging();
        return 0;
    }

    FrameSequence sequence;
    if (!captureSequence(*backend, systemClock(), *hold, config, sequence,
                         err)) {
        LOG_ERROR("capture failed on backend '%s': %s",
                  backend->name().c_str(), err.c_str());
        closeFileLogging();
        return 1;
    }
    printSequence(sequence);

    closeFileLogging();
    return 0;
}
