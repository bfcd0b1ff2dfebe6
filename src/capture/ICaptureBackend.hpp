#pragma once

#include <memory>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"

namespace screenier {

// Long-lived capture handle for one display. tryFrame() never blocks waiting
// for the next frame; it reports NotReady instead.
class IDisplaySession {
public:
    virtual ~IDisplaySession() = default;
    virtual FrameAttempt tryFrame() = 0;
};

class ICaptureBackend {
public:
    virtual ~ICaptureBackend() = default;
    virtual std::string name() const = 0;
    virtual bool isAvailable() const = 0;
    virtual std::vector<MonitorInfo> listMonitors() = 0;
    virtual std::unique_ptr<IDisplaySession> openSession(
        const MonitorInfo& monitor, std::string& err) = 0;
};

}  // namespace screenier
