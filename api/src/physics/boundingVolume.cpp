#include "dbvh/physics/boundingVolume.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <stdexcept>

namespace dbvh::physics3D {

    std::optional<float> BoundingVolume::Intersects(const Ray& ray, float tMax) const {
        float tmin = 0.0f;
        float tmax = tMax;

        for (int i = 0; i < 3; ++i) {
            const float o = ray.origin[i];
            const float d = ray.dir[i];
            const float minVal = m_min[i];
            const float maxVal = m_max[i];

            if (std::abs(d) < 1e-8f) {
                // Raio paralelo ao plano desse eixo → deve estar dentro do slab
                if (o < minVal || o > maxVal)
                    return std::nullopt;
                continue;
            }

            const float invD = 1.0f / d;
            float t0 = (minVal - o) * invD;
            float t1 = (maxVal - o) * invD;
            if (invD < 0.0f) std::swap(t0, t1);

            tmin = std::max(tmin, t0);
            tmax = std::min(tmax, t1);
            if (tmax < tmin)
                return std::nullopt;
        }
        return tmin;
    }

    std::string BoundingVolume::ToString() const {
        return fmt::format("Min: ({}, {}, {}), Max: ({}, {}, {})",
                           m_min.x, m_min.y, m_min.z, m_max.x, m_max.y, m_max.z);
    }

    namespace {
        nlohmann::json vecToJson(const math::Vec3& v) {
            return nlohmann::json::array({ v.x, v.y, v.z });
        }

        math::Vec3 vecFromJson(const nlohmann::json& j) {
            if (!j.is_array() || j.size() != 3)
                throw std::invalid_argument("expected an array of 3 numbers, got " + j.dump());
            const auto a = j.get<std::array<float, 3>>();
            return math::Vec3(a[0], a[1], a[2]);
        }
    }

    void to_json(nlohmann::json& j, const BoundingVolume& bv) {
        j = nlohmann::json{ { "min", vecToJson(bv.Min()) }, { "max", vecToJson(bv.Max()) } };
    }

    void from_json(const nlohmann::json& j, BoundingVolume& bv) {
        bv = BoundingVolume(vecFromJson(j.at("min")), vecFromJson(j.at("max")));
    }

} // namespace dbvh::physics3D
