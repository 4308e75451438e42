#pragma once

#include "dbvh/core/math.hpp"

namespace dbvh::physics3D {
    struct Ray {
        math::Vec3 origin{0.0f};
        math::Vec3 dir{0.0f, 0.0f, 1.0f}; // sempre normalizado

        Ray() = default;
        Ray(const math::Vec3& o, const math::Vec3& d)
            : origin(o), dir(math::Normalize(d)) {}

        math::Vec3 GetPoint(float t) const { return origin + dir * t; }
    };

    /**
     * @brief One ray/volume hit reported by the tree.
     * @tparam KeyT Key type stored in the tree.
     */
    template <typename KeyT>
    struct RayHit {
        KeyT key{};
        float distance = 0.0f;  // distância ao longo do raio (0 se a origem está dentro)
        math::Vec3 point{0.0f};
    };
}
