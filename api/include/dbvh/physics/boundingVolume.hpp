#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "dbvh/core/math.hpp"
#include "dbvh/physics/ray.hpp"

namespace dbvh::physics3D {

    /**
     * @brief Immutable axis-aligned bounding volume.
     *
     * Volume() is the sum of the squared extents. It is only used as a cost
     * proxy to compare candidate subtrees, never as a geometric volume.
     */
    class BoundingVolume {
    public:
        BoundingVolume() = default;
        BoundingVolume(const math::Vec3& mi, const math::Vec3& ma)
            : m_min(mi), m_max(ma) {}

        /// Volume centrado em @p center com meia-extensão @p halfExtents.
        static BoundingVolume FromCenterExtents(const math::Vec3& center, const math::Vec3& halfExtents) {
            return BoundingVolume(center - halfExtents, center + halfExtents);
        }

        // -------------------------------
        // Utilitários básicos
        // -------------------------------
        const math::Vec3& Min() const { return m_min; }
        const math::Vec3& Max() const { return m_max; }

        math::Vec3 Center() const { return (m_min + m_max) * 0.5f; }
        math::Vec3 Size() const { return m_max - m_min; }
        math::Vec3 Extents() const { return Size() * 0.5f; }

        double Volume() const {
            const math::Vec3 s = Size();
            return static_cast<double>(s.x) * s.x
                 + static_cast<double>(s.y) * s.y
                 + static_cast<double>(s.z) * s.z;
        }

        /// Min <= Max em todos os eixos e nenhum componente NaN.
        bool IsValid() const {
            if (math::AnyNaN(m_min) || math::AnyNaN(m_max)) return false;
            return m_min.x <= m_max.x && m_min.y <= m_max.y && m_min.z <= m_max.z;
        }

        BoundingVolume Union(const BoundingVolume& other) const {
            return BoundingVolume(math::Min(m_min, other.m_min), math::Max(m_max, other.m_max));
        }

        /// Growth of this volume's cost when extended to also cover @p other.
        double GetCost(const BoundingVolume& other) const {
            return Union(other).Volume() - Volume();
        }

        bool Contains(const math::Vec3& p) const {
            return (p.x >= m_min.x && p.x <= m_max.x &&
                    p.y >= m_min.y && p.y <= m_max.y &&
                    p.z >= m_min.z && p.z <= m_max.z);
        }

        bool Contains(const BoundingVolume& other) const {
            return (other.m_min.x >= m_min.x && other.m_max.x <= m_max.x) &&
                   (other.m_min.y >= m_min.y && other.m_max.y <= m_max.y) &&
                   (other.m_min.z >= m_min.z && other.m_max.z <= m_max.z);
        }

        // Intervalos fechados: encostar conta como interseção
        bool Intersects(const BoundingVolume& b) const {
            return !(b.m_max.x < m_min.x || b.m_min.x > m_max.x ||
                     b.m_max.y < m_min.y || b.m_min.y > m_max.y ||
                     b.m_max.z < m_min.z || b.m_min.z > m_max.z);
        }

        /**
         * @brief Slab test against a ray.
         * @return Entry distance in [0, tMax], or nullopt when the ray misses.
         */
        std::optional<float> Intersects(const Ray& ray, float tMax) const;

        bool operator==(const BoundingVolume& other) const {
            return m_min == other.m_min && m_max == other.m_max;
        }
        bool operator!=(const BoundingVolume& other) const { return !(*this == other); }

        std::string ToString() const;

    private:
        math::Vec3 m_min{0.0f};
        math::Vec3 m_max{0.0f};
    };

    // JSON: { "min": [x,y,z], "max": [x,y,z] }
    void to_json(nlohmann::json& j, const BoundingVolume& bv);
    void from_json(const nlohmann::json& j, BoundingVolume& bv);

} // namespace dbvh::physics3D
