#pragma once

#include <glm/glm.hpp>

#include <cmath>

namespace dbvh::math
{
    // --- Typedefs --- //
    using Vec3 = glm::vec3;

    // --- Vetores --- //
    inline Vec3 Normalize(const Vec3& v) { return glm::normalize(v); }

    // Componente a componente
    inline Vec3 Min(const Vec3& a, const Vec3& b) { return glm::min(a, b); }
    inline Vec3 Max(const Vec3& a, const Vec3& b) { return glm::max(a, b); }

    /// true se algum componente for NaN.
    inline bool AnyNaN(const Vec3& v) {
        return std::isnan(v.x) || std::isnan(v.y) || std::isnan(v.z);
    }
} // namespace dbvh::math
