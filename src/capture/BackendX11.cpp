#include "capture/BackendX11.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "capture/PixelConvert.hpp"
#include "platform/Log.hpp"

namespace screenier {

namespace {

int g_xErrorCode = 0;

int recordXError(Display*, XErrorEvent* event) {
    g_xErrorCode = event->error_code;
    return 0;
}

std::vector<MonitorInfo> listMonitorsFromResources(
    Display* display, Window root, XRRScreenResources* resources) {
    std::vector<MonitorInfo> result;
    if (!display || !resources) {
        return result;
    }
    RROutput primary = XRRGetOutputPrimary(display, root);
    for (int i = 0; i < resources->noutput; ++i) {
        RROutput output = resources->outputs[i];
        XRROutputInfo* info = XRRGetOutputInfo(display, resources, output);
        if (!info) {
            continue;
        }
        if (info->connection == RR_Connected && info->crtc) {
            XRRCrtcInfo* crtc = XRRGetCrtcInfo(display, resources, info->crtc);
            if (crtc) {
                MonitorInfo mon;
                mon.name.assign(info->name, info->nameLen);
                mon.x = crtc->x;
                mon.y = crtc->y;
                mon.w = static_cast<int>(crtc->width);
                mon.h = static_cast<int>(crtc->height);
                mon.scale = 1.0f;
                mon.primary = (output == primary);
                result.push_back(mon);
                XRRFreeCrtcInfo(crtc);
            }
        }
        XRRFreeOutputInfo(info);
    }
    return result;
}

class X11DisplaySession final : public IDisplaySession {
public:
    X11DisplaySession(Display* display, const MonitorInfo& monitor)
        : display_(display), monitor_(monitor) {}

    ~X11DisplaySession() override {
        if (display_) {
            XCloseDisplay(display_);
        }
    }

    X11DisplaySession(const X11DisplaySession&) = delete;
    X11DisplaySession& operator=(const X11DisplaySession&) = delete;

    FrameAttempt tryFrame() override {
        Window root = DefaultRootWindow(display_);

        // XGetImage raises BadMatch when the rectangle leaves the root
        // window, e.g. after a mode change; report it instead of exiting.
        XSync(display_, False);
        g_xErrorCode = 0;
        auto previousHandler = XSetErrorHandler(recordXError);
        XImage* image = XGetImage(
            display_, root, monitor_.x, monitor_.y,
            static_cast<unsigned int>(monitor_.w),
            static_cast<unsigned int>(monitor_.h), AllPlanes, ZPixmap);
        XSync(display_, False);
        XSetErrorHandler(previousHandler);

        if (!image) {
            return FrameAttempt::fatal(
                "XGetImage failed (X error " + std::to_string(g_xErrorCode) +
                ", permissions or remote session?)");
        }

        PixelLayout layout;
        if (!layoutFromMasks(image->bits_per_pixel, image->red_mask,
                             image->green_mask, image->blue_mask,
                             image->byte_order == MSBFirst, layout)) {
            std::string err = "unsupported pixel format: " +
                              std::to_string(image->bits_per_pixel) + " bpp";
            XDestroyImage(image);
            return FrameAttempt::fatal(err);
        }

        RawFrame frame;
        frame.width = image->width;
        frame.height = image->height;
        frame.stride = image->bytes_per_line;
        frame.layout = layout;
        const size_t size = static_cast<size_t>(image->bytes_per_line) *
                            static_cast<size_t>(image->height);
        const auto* data = reinterpret_cast<const std::uint8_t*>(image->data);
        frame.bytes.assign(data, data + size);
        XDestroyImage(image);
        return FrameAttempt::ready(std::move(frame));
    }

private:
    Display* display_ = nullptr;
    MonitorInfo monitor_;
};

}  // namespace

class X11CaptureBackend final : public ICaptureBackend {
public:
    std::string name() const override {
        return "x11";
    }

    bool isAvailable() const override {
        const char* displayEnv = std::getenv("DISPLAY");
        if (!displayEnv) {
            return false;
        }
        Display* display = XOpenDisplay(nullptr);
        if (!display) {
            return false;
        }
        XCloseDisplay(display);
        return true;
    }

    std::vector<MonitorInfo> listMonitors() override {
        std::vector<MonitorInfo> result;
        Display* display = XOpenDisplay(nullptr);
        if (!display) {
            LOG_ERROR("X11: failed to open display for monitor list");
            return result;
        }

        Window root = DefaultRootWindow(display);
        XRRScreenResources* resources =
            XRRGetScreenResourcesCurrent(display, root);
        if (resources) {
            result = listMonitorsFromResources(display, root, resources);
            XRRFreeScreenResources(resources);
        } else {
            LOG_WARN("X11: failed to get screen resources");
        }

        // Without RandR outputs the root window is the only display.
        if (result.empty()) {
            int screen = DefaultScreen(display);
            MonitorInfo mon;
            mon.name = "screen" + std::to_string(screen);
            mon.w = DisplayWidth(display, screen);
            mon.h = DisplayHeight(display, screen);
            mon.primary = true;
            result.push_back(mon);
            LOG_DEBUG("X11: no RandR outputs, using root window %dx%d", mon.w,
                      mon.h);
        }

        XCloseDisplay(display);
        return result;
    }

    std::unique_ptr<IDisplaySession> openSession(const MonitorInfo& monitor,
                                                 std::string& err) override {
        Display* display = XOpenDisplay(nullptr);
        if (!display) {
            err = "X11: failed to open display for capture";
            return nullptr;
        }
        int screen = DefaultScreen(display);
        int rootW = DisplayWidth(display, screen);
        int rootH = DisplayHeight(display, screen);
        if (monitor.w <= 0 || monitor.h <= 0 || monitor.x < 0 ||
            monitor.y < 0 || monitor.right() > rootW ||
            monitor.bottom() > rootH) {
            err = "X11: output '" + monitor.name +
                  "' lies outside the root window";
            XCloseDisplay(display);
            return nullptr;
        }
        LOG_DEBUG("X11: session for %s at %d,%d %dx%d", monitor.name.c_str(),
                  monitor.x, monitor.y, monitor.w, monitor.h);
        return std::make_unique<X11DisplaySession>(display, monitor);
    }
};

std::unique_ptr<ICaptureBackend> CreateBackendX11() {
    return std::make_unique<X11CaptureBackend>();
}

}  // namespace screenier
