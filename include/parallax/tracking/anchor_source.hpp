#pragma once

#include "parallax/core/core.hpp"
#include "parallax/core/math.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace parallax::tracking {

enum class Anchor : uint8_t {
    LeftEye = 0,
    RightEye,
    NoseTip,
    Pointer,
};

// What the estimator needs from a tracking backend: a normalized [0,1]
// image point per anchor, or nothing if the backend has no such point.
struct IAnchorSource {
    virtual std::optional<vec2d> anchorPoint(Anchor anchor) const = 0;
    virtual ~IAnchorSource() = default;
};

struct LandmarkIndices {
    std::size_t left_eye{33};
    std::size_t right_eye{263};
    std::size_t nose_tip{4};
};

// View over one frame of face landmarks. Does not own the landmarks.
class LandmarkAnchors : public IAnchorSource {
  public:
    LandmarkAnchors(std::span<const core::Landmark> landmarks,
                    LandmarkIndices indices = {})
        : landmarks_(landmarks), indices_(indices) {}

    std::optional<vec2d> anchorPoint(Anchor anchor) const override {
        switch (anchor) {
        case Anchor::LeftEye:
            return at_(indices_.left_eye);
        case Anchor::RightEye:
            return at_(indices_.right_eye);
        case Anchor::NoseTip:
            return at_(indices_.nose_tip);
        case Anchor::Pointer:
            return std::nullopt;
        }
        return std::nullopt;
    }

  private:
    std::optional<vec2d> at_(std::size_t index) const {
        if (index >= landmarks_.size())
            return std::nullopt;
        const auto &lm = landmarks_[index];
        return vec2d{lm.x, lm.y};
    }

    std::span<const core::Landmark> landmarks_;
    LandmarkIndices indices_;
};

// Mouse/touch surrogate, normalized to the window like image coordinates.
class PointerAnchors : public IAnchorSource {
  public:
    explicit PointerAnchors(vec2d pointer) : pointer_(pointer) {}

    std::optional<vec2d> anchorPoint(Anchor anchor) const override {
        if (anchor == Anchor::Pointer)
            return pointer_;
        return std::nullopt;
    }

  private:
    vec2d pointer_;
};

} // namespace parallax::tracking
