#include <cstdlib>
#include <memory>
#include <utility>

#include "capture/BackendFactory.hpp"
#include "platform/Log.hpp"

#if defined(SCREENIER_HAS_X11)
#include "capture/BackendX11.hpp"
#endif

namespace screenier {

namespace {

std::unique_ptr<ICaptureBackend> createX11() {
#if defined(SCREENIER_HAS_X11)
    return CreateBackendX11();
#else
    return nullptr;
#endif
}

}  // namespace

class BackendAuto final : public ICaptureBackend {
public:
    std::string name() const override {
        auto backend = selectBackend();
        return backend ? backend->name() : "auto";
    }

    bool isAvailable() const override {
        auto selected = selectBackend();
        return selected != nullptr;
    }

    std::vector<MonitorInfo> listMonitors() override {
        auto backend = selectBackend();
        if (!backend) {
            return {};
        }
        return backend->listMonitors();
    }

    std::unique_ptr<IDisplaySession> openSession(const MonitorInfo& monitor,
                                                 std::string& err) override {
        auto backend = selectBackend();
        if (!backend) {
            err = "no capture backend available";
            return nullptr;
        }
        return backend->openSession(monitor, err);
    }

private:
    ICaptureBackend* selectBackend() const {
        if (selected_) {
            return selected_.get();
        }
        bool hasX11 = std::getenv("DISPLAY") != nullptr;
        bool hasWayland = std::getenv("WAYLAND_DISPLAY") != nullptr;

        if (hasX11) {
            auto backend = createX11();
            if (backend && backend->isAvailable()) {
                selected_ = std::move(backend);
                LOG_DEBUG("auto backend selected: x11");
                return selected_.get();
            }
        }
        if (hasWayland && !hasX11) {
            LOG_WARN("Wayland session without DISPLAY; only X11 capture is "
                     "supported");
        }

        LOG_ERROR("auto backend selection failed: no available backend");
        return nullptr;
    }

    mutable std::unique_ptr<ICaptureBackend> selected_;
};

std::unique_ptr<ICaptureBackend> CreateBackend(BackendKind kind) {
    switch (kind) {
        case BackendKind::Auto:
            return std::make_unique<BackendAuto>();
        case BackendKind::X11: {
            auto backend = createX11();
            if (!backend) {
                LOG_ERROR("x11 backend disabled at build time");
            }
            return backend;
        }
    }
    return nullptr;
}

}  // namespace screenier
