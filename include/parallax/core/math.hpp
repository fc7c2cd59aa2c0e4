#pragma once

#include <glm/glm.hpp>

namespace parallax {

// World space is right-handed, meters, y up. Matrices follow glm's
// column-major storage: m[col][row].
using vec2d = glm::dvec2;
using vec3d = glm::dvec3;
using mat4d = glm::dmat4;

inline bool isFinite(const mat4d &m) {
    for (glm::length_t c = 0; c < 4; ++c) {
        if (glm::any(glm::isnan(m[c])) || glm::any(glm::isinf(m[c])))
            return false;
    }
    return true;
}

} // namespace parallax
