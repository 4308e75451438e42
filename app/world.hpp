#pragma once

#include <cstdint>
#include <random>
#include <entt/entt.hpp>

#include <dbvh/core/config.hpp>
#include <dbvh/core/diagnostics.hpp>
#include <dbvh/core/threadPool.hpp>
#include <dbvh/containers/dynamicBVH.hpp>

namespace dbvh::sandbox {

    struct Body {
        math::Vec3 position{ 0.0f };
        math::Vec3 velocity{ 0.0f };
        float halfExtent = 1.0f;

        physics3D::BoundingVolume Bounds() const {
            return physics3D::BoundingVolume::FromCenterExtents(position, math::Vec3(halfExtent));
        }
    };

    using BodyTree = DynamicBVH<uint32_t>;

    /**
     * @brief Bodies moving inside a cubic world, mirrored in a DynamicBVH.
     *
     * Adding a Body component inserts the entity in the tree; destroying it
     * removes the entry. FixedUpdate integrates the bodies, pushes their new
     * volumes from the thread pool and runs one neighbourhood query per body.
     */
    class World {
    public:
        explicit World(const SandboxConfig& config);
        ~World();

        World(const World&) = delete;
        World& operator=(const World&) = delete;
        World(World&&) = delete;
        World& operator=(World&&) = delete;

        /// Cria @p count corpos com posição e velocidade aleatórias.
        void Spawn(int count);

        /**
         * @brief Advance one fixed step.
         * @return Number of (body, neighbour) pairs found by the queries of this step.
         */
        size_t FixedUpdate(double delta, ThreadPool& pool, DiagnosticsManager& diagnostics);

        entt::registry& GetRegistry() { return m_registry; }
        BodyTree& GetWorldSpace() { return m_worldSpace; }

    private:
        void setupCallbacks();
        void onBodyAddCallback(entt::registry& reg, entt::entity e);
        void onBodyRemovedCallback(entt::registry& reg, entt::entity e);

        void integrate(double delta);

    private:
        SandboxConfig m_config;
        BodyTree m_worldSpace;
        entt::registry m_registry;
        std::mt19937 m_rng;
    };

} // namespace dbvh::sandbox
