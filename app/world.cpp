#include "world.hpp"

#include <algorithm>
#include <future>
#include <vector>
#include <dbvh/core/debug.hpp>

namespace dbvh::sandbox {
    namespace {
        uint32_t toKey(entt::entity e) { return static_cast<uint32_t>(entt::to_integral(e)); }

        // Divide [0, count) em fatias, uma por worker
        std::vector<std::pair<size_t, size_t>> makeChunks(size_t count, size_t parts) {
            std::vector<std::pair<size_t, size_t>> chunks;
            if (count == 0) return chunks;

            parts = std::max<size_t>(1, std::min(parts, count));
            const size_t step = (count + parts - 1) / parts;
            for (size_t begin = 0; begin < count; begin += step)
                chunks.emplace_back(begin, std::min(count, begin + step));
            return chunks;
        }
    }

    World::World(const SandboxConfig& config)
        : m_config(config), m_worldSpace(config.tree), m_rng(config.seed) {

        setupCallbacks();
    }

    World::~World() {
        m_registry.clear();
    }

    void World::Spawn(int count) {
        const float extent = m_config.worldExtent - m_config.bodyHalfExtent;
        std::uniform_real_distribution<float> pos(-extent, extent);
        std::uniform_real_distribution<float> vel(-m_config.maxSpeed, m_config.maxSpeed);

        m_worldSpace.EnsureCapacity(m_worldSpace.Count() + static_cast<size_t>(count));

        for (int i = 0; i < count; ++i) {
            const entt::entity e = m_registry.create();
            m_registry.emplace<Body>(e, Body{
                math::Vec3(pos(m_rng), pos(m_rng), pos(m_rng)),
                math::Vec3(vel(m_rng), vel(m_rng), vel(m_rng)),
                m_config.bodyHalfExtent });
        }

        DBVH_LOG_INFO("{} corpos criados ({} no total).", count, m_worldSpace.Count());
    }

    size_t World::FixedUpdate(double delta, ThreadPool& pool, DiagnosticsManager& diagnostics) {
        {
            ScopedTimer timer(diagnostics, "integrate");
            integrate(delta);
        }

        // Snapshot dos volumes: as tarefas não tocam no registry
        std::vector<std::pair<uint32_t, physics3D::BoundingVolume>> moved;
        moved.reserve(m_registry.view<Body>().size());
        for (auto [e, body] : m_registry.view<Body>().each())
            moved.emplace_back(toKey(e), body.Bounds());

        const auto chunks = makeChunks(moved.size(), pool.GetThreadCount());

        {
            ScopedTimer timer(diagnostics, "update");
            std::vector<std::future<size_t>> pending;
            for (const auto& [begin, end] : chunks) {
                pending.push_back(pool.Submit(TaskPriority::HIGH, [this, &moved, begin = begin, end = end] {
                    size_t missing = 0;
                    for (size_t i = begin; i < end; ++i) {
                        if (!m_worldSpace.UpdateEntryBounds(moved[i].first, moved[i].second))
                            ++missing;
                    }
                    return missing;
                }));
            }

            // as tarefas leem `moved`: todas terminam antes de qualquer exceção subir
            size_t missing = 0;
            for (size_t count : WaitAll(pending))
                missing += count;
            if (missing > 0)
                DBVH_LOG_WARN("{} corpos não estavam na árvore.", missing);
        }

        size_t pairs = 0;
        {
            ScopedTimer timer(diagnostics, "query");
            std::vector<std::future<size_t>> pending;
            for (const auto& [begin, end] : chunks) {
                pending.push_back(pool.Submit(TaskPriority::NORMAL, [this, &moved, begin = begin, end = end] {
                    size_t found = 0;
                    std::vector<uint32_t> hits;
                    const math::Vec3 radius(m_config.queryRadius);
                    for (size_t i = begin; i < end; ++i) {
                        hits.clear();
                        const math::Vec3 center = moved[i].second.Center();
                        m_worldSpace.Query(physics3D::BoundingVolume(center - radius, center + radius), hits);
                        // o próprio corpo sempre aparece
                        found += hits.empty() ? 0 : hits.size() - 1;
                    }
                    return found;
                }));
            }

            for (size_t count : WaitAll(pending))
                pairs += count;
        }

        return pairs;
    }

    void World::setupCallbacks() {
        m_registry.on_construct<Body>().connect<&World::onBodyAddCallback>(this);
        m_registry.on_destroy<Body>().connect<&World::onBodyRemovedCallback>(this);
    }

    void World::onBodyAddCallback(entt::registry& reg, entt::entity e) {
        const Body& body = reg.get<Body>(e);
        m_worldSpace.Insert(toKey(e), body.Bounds());
    }

    void World::onBodyRemovedCallback(entt::registry&, entt::entity e) {
        m_worldSpace.Remove(toKey(e));
    }

    void World::integrate(double delta) {
        const float dt = static_cast<float>(delta);
        const float limit = m_config.worldExtent - m_config.bodyHalfExtent;

        for (auto [e, body] : m_registry.view<Body>().each()) {
            body.position += body.velocity * dt;

            // Rebate nas paredes do mundo
            for (int axis = 0; axis < 3; ++axis) {
                if (body.position[axis] > limit) {
                    body.position[axis] = limit;
                    body.velocity[axis] = -body.velocity[axis];
                } else if (body.position[axis] < -limit) {
                    body.position[axis] = -limit;
                    body.velocity[axis] = -body.velocity[axis];
                }
            }
        }
    }

} // namespace dbvh::sandbox
