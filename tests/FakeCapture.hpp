#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "capture/ICaptureBackend.hpp"
#include "input/IHoldCondition.hpp"
#include "platform/Time.hpp"

namespace screenier::fakes {

// BGRX frame of a single colour with optional row padding. Padding bytes are
// 0xEE so leaks are easy to spot.
inline RawFrame solidFrame(int w, int h, std::uint8_t r, std::uint8_t g,
                           std::uint8_t b, int padding = 0) {
    RawFrame frame;
    frame.width = w;
    frame.height = h;
    frame.stride = w * 4 + padding;
    frame.layout = kLayoutBgrx8888;
    frame.bytes.assign(static_cast<size_t>(frame.stride) * h, 0xEE);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            size_t i = static_cast<size_t>(frame.stride) * y + 4u * x;
            frame.bytes[i + 0] = b;
            frame.bytes[i + 1] = g;
            frame.bytes[i + 2] = r;
            frame.bytes[i + 3] = 0;
        }
    }
    return frame;
}

inline RawFrame blackFrame(int w, int h) {
    RawFrame frame;
    frame.width = w;
    frame.height = h;
    frame.stride = w * 4;
    frame.layout = kLayoutBgrx8888;
    frame.bytes.assign(static_cast<size_t>(frame.stride) * h, 0);
    return frame;
}

struct SessionScript {
    std::deque<FrameAttempt> queued;
    // Returned once the queue is drained.
    FrameAttempt steady = FrameAttempt::notReady();
    int calls = 0;
    bool destroyed = false;

    void push(FrameAttempt attempt) {
        queued.push_back(std::move(attempt));
    }
    void pushNotReady(int count) {
        for (int i = 0; i < count; ++i) {
            queued.push_back(FrameAttempt::notReady());
        }
    }
};

class FakeDisplaySession final : public IDisplaySession {
public:
    explicit FakeDisplaySession(std::shared_ptr<SessionScript> script)
        : script_(std::move(script)) {}

    ~FakeDisplaySession() override {
        script_->destroyed = true;
    }

    FrameAttempt tryFrame() override {
        ++script_->calls;
        if (script_->queued.empty()) {
            return script_->steady;
        }
        FrameAttempt attempt = std::move(script_->queued.front());
        script_->queued.pop_front();
        return attempt;
    }

private:
    std::shared_ptr<SessionScript> script_;
};

class FakeBackend final : public ICaptureBackend {
public:
    std::shared_ptr<SessionScript> addMonitor(const std::string& name, int x,
                                              int y, int w, int h) {
        MonitorInfo mon;
        mon.name = name;
        mon.x = x;
        mon.y = y;
        mon.w = w;
        mon.h = h;
        monitors_.push_back(mon);
        auto script = std::make_shared<SessionScript>();
        scripts_[name] = script;
        return script;
    }

    std::string name() const override {
        return "fake";
    }

    bool isAvailable() const override {
        return true;
    }

    std::vector<MonitorInfo> listMonitors() override {
        ++listCalls;
        return monitors_;
    }

    std::unique_ptr<IDisplaySession> openSession(const MonitorInfo& monitor,
                                                 std::string& err) override {
        ++openCalls;
        if (monitor.name == failOpenFor) {
            err = "device busy";
            return nullptr;
        }
        return std::make_unique<FakeDisplaySession>(scripts_.at(monitor.name));
    }

    int listCalls = 0;
    int openCalls = 0;
    std::string failOpenFor;

private:
    std::vector<MonitorInfo> monitors_;
    std::map<std::string, std::shared_ptr<SessionScript>> scripts_;
};

class ManualClock final : public IClock {
public:
    TimePoint now() const override {
        return now_;
    }

    void sleepFor(Duration duration) override {
        ++sleeps;
        now_ += duration;
    }

    void advance(Duration duration) {
        now_ += duration;
    }

    int sleeps = 0;

private:
    TimePoint now_{};
};

// Reports the scripted answers in order, then false. onSample runs before
// each answer is returned.
class ScriptedHold final : public IHoldCondition {
public:
    ScriptedHold() = default;
    explicit ScriptedHold(std::initializer_list<bool> answers)
        : answers_(answers) {}

    bool isHeld() override {
        if (onSample) {
            onSample();
        }
        size_t index = static_cast<size_t>(samples++);
        return index < answers_.size() && answers_[index];
    }

    int samples = 0;
    std::function<void()> onSample;

private:
    std::vector<bool> answers_;
};

// RGBA of pixel (x, y) packed as 0xRRGGBBAA.
inline std::uint32_t pixelAt(const ImageRGBA& image, int x, int y) {
    size_t i = (static_cast<size_t>(y) * image.w + x) * 4u;
    return (static_cast<std::uint32_t>(image.rgba[i]) << 24) |
           (static_cast<std::uint32_t>(image.rgba[i + 1]) << 16) |
           (static_cast<std::uint32_t>(image.rgba[i + 2]) << 8) |
           static_cast<std::uint32_t>(image.rgba[i + 3]);
}

// True when every pixel of the rectangle equals the packed colour.
inline bool regionIs(const ImageRGBA& image, int x0, int y0, int w, int h,
                     std::uint32_t rgba) {
    for (int y = y0; y < y0 + h; ++y) {
        for (int x = x0; x < x0 + w; ++x) {
            if (pixelAt(image, x, y) != rgba) {
                return false;
            }
        }
    }
    return true;
}

inline bool regionsEqual(const ImageRGBA& a, const ImageRGBA& b, int x0,
                         int y0, int w, int h) {
    for (int y = y0; y < y0 + h; ++y) {
        for (int x = x0; x < x0 + w; ++x) {
            if (pixelAt(a, x, y) != pixelAt(b, x, y)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace screenier::fakes
