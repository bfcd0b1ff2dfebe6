#pragma once

#include <string>

#include "capture/BackendFactory.hpp"
#include "capture/CaptureConfig.hpp"

namespace screenier {

struct CliOptions {
    BackendKind backend = BackendKind::Auto;
    bool listMonitors = false;
    bool debug = false;
    bool noAnimate = false;
    int retryThreshold = CaptureConfig{}.notReadyRetryThreshold;
};

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err);
std::string backendKindToString(BackendKind kind);
CaptureConfig captureConfigFromCli(const CliOptions& options);

}  // namespace screenier
