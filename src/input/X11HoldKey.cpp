#include "input/X11HoldKey.hpp"

#include <X11/Xlib.h>
#include <X11/keysym.h>

#include <initializer_list>
#include <memory>
#include <vector>

#include "platform/Log.hpp"

namespace screenier {

class X11HoldKey final : public IHoldCondition {
public:
    X11HoldKey() {
        display_ = XOpenDisplay(nullptr);
        if (!display_) {
            LOG_ERROR("failed to open X11 display for keyboard state");
            return;
        }
        for (KeySym sym : {XK_Shift_L, XK_Shift_R}) {
            KeyCode code = XKeysymToKeycode(display_, sym);
            if (code != 0) {
                keycodes_.push_back(code);
            }
        }
        if (keycodes_.empty()) {
            LOG_ERROR("keyboard map has no Shift keys");
            return;
        }
        valid_ = true;
    }

    ~X11HoldKey() override {
        if (display_) {
            XCloseDisplay(display_);
        }
    }

    X11HoldKey(const X11HoldKey&) = delete;
    X11HoldKey& operator=(const X11HoldKey&) = delete;

    bool isValid() const {
        return valid_;
    }

    bool isHeld() override {
        char keys[32] = {};
        XQueryKeymap(display_, keys);
        for (KeyCode code : keycodes_) {
            if (keys[code / 8] & (1 << (code % 8))) {
                return true;
            }
        }
        return false;
    }

private:
    Display* display_ = nullptr;
    std::vector<KeyCode> keycodes_;
    bool valid_ = false;
};

std::unique_ptr<IHoldCondition> CreateX11HoldKey() {
    auto hold = std::make_unique<X11HoldKey>();
    if (!hold->isValid()) {
        return nullptr;
    }
    return hold;
}

}  // namespace screenier
