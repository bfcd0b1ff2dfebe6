#pragma once

namespace screenier {

// Sampled once per animated iteration; the sequence ends the first time it
// reports false.
class IHoldCondition {
public:
    virtual ~IHoldCondition() = default;
    virtual bool isHeld() = 0;
};

}  // namespace screenier
