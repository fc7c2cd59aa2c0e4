#pragma once

#include "parallax/core/core.hpp"
#include "parallax/core/math.hpp"
#include "parallax/core/utils.hpp"
#include "parallax/projection/screen_quad.hpp"
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace parallax::projection {

// Near-plane extents, meters.
struct Frustum {
    double left{0.0};
    double right{0.0};
    double bottom{0.0};
    double top{0.0};
    double near{0.1};
    double far{200.0};
};

struct CameraMatrices {
    mat4d view{1.0};
    mat4d projection{1.0};
    mat4d view_inverse{1.0};
    mat4d projection_inverse{1.0};
    Frustum frustum{};
    vec3d eye{}; // meters
};

// OpenGL convention: clip z in [-1, 1], w = -z_eye.
inline mat4d frustumMatrix(const Frustum &f) {
    return glm::frustum(f.left, f.right, f.bottom, f.top, f.near, f.far);
}

// Vertical field of view of a projection built by frustumMatrix, degrees.
inline double verticalFov(const Frustum &f) {
    return core::rad2deg(std::atan(f.top / f.near) -
                         std::atan(f.bottom / f.near));
}

// Generalized perspective projection for a viewer at `eye_cm` looking
// through `quad`. Returns nullopt when the eye is on or behind the screen
// plane, or any input is non-finite.
inline std::optional<CameraMatrices>
buildOffAxis(const core::EyePosition &eye_cm, const ScreenQuad &quad,
             double near, double far) {
    if (!core::allFinite(eye_cm.x, eye_cm.y, eye_cm.z, near, far))
        return std::nullopt;
    // The viewer side of the screen plane is +z. The normal flip below only
    // corrects corner winding, it does not admit an eye behind the screen.
    if (eye_cm.z <= 0.0 || near <= 0.0 || far <= near)
        return std::nullopt;

    const vec3d pe{eye_cm.x / 100.0, eye_cm.y / 100.0, eye_cm.z / 100.0};
    const vec3d &pa = quad.pa;
    const vec3d &pb = quad.pb;
    const vec3d &pc = quad.pc;

    vec3d vr = glm::normalize(pb - pa);
    vec3d vu = glm::normalize(pc - pa);
    vec3d vn = glm::normalize(glm::cross(vr, vu));
    if (glm::dot(vn, pe - pa) < 0.0)
        vn = -vn;

    // Eye to corners
    vec3d va = pa - pe;
    vec3d vb = pb - pe;
    vec3d vc = pc - pe;

    double d = -glm::dot(vn, va);
    if (!std::isfinite(d) || d <= 0.0)
        return std::nullopt;

    double scale = near / d;
    CameraMatrices out;
    out.frustum = {
        .left = glm::dot(vr, va) * scale,
        .right = glm::dot(vr, vb) * scale,
        .bottom = glm::dot(vu, va) * scale,
        .top = glm::dot(vu, vc) * scale,
        .near = near,
        .far = far,
    };
    out.projection = frustumMatrix(out.frustum);

    // Rows of the rotation are the screen basis; the camera looks along -vn.
    mat4d basis{1.0};
    basis[0] = glm::dvec4(vr, 0.0);
    basis[1] = glm::dvec4(vu, 0.0);
    basis[2] = glm::dvec4(vn, 0.0);
    out.view = glm::transpose(basis) * glm::translate(mat4d{1.0}, -pe);
    out.eye = pe;

    out.view_inverse = glm::inverse(out.view);
    out.projection_inverse = glm::inverse(out.projection);

    if (!isFinite(out.view) || !isFinite(out.projection) ||
        !isFinite(out.view_inverse) || !isFinite(out.projection_inverse))
        return std::nullopt;
    return out;
}

// Holds the last valid matrices. A degenerate update leaves them untouched.
class OffAxisCamera {
  public:
    bool update(const core::EyePosition &eye_cm, const ScreenQuad &quad,
                double near, double far) {
        auto built = buildOffAxis(eye_cm, quad, near, far);
        if (!built) {
            ++skipped_;
            spdlog::debug("Off-axis update skipped for eye ({:.2f}, {:.2f}, "
                          "{:.2f}) cm",
                          eye_cm.x, eye_cm.y, eye_cm.z);
            return false;
        }
        matrices_ = *built;
        valid_ = true;
        return true;
    }

    const CameraMatrices &matrices() const { return matrices_; }

    // False until the first successful update.
    bool valid() const { return valid_; }

    uint64_t skippedCount() const { return skipped_; }

  private:
    CameraMatrices matrices_{};
    bool valid_{false};
    uint64_t skipped_{0};
};

} // namespace parallax::projection
