#include <dbvh/core/config.hpp>
#include <dbvh/core/debug.hpp>
#include <dbvh/core/diagnostics.hpp>
#include <dbvh/core/errors.hpp>
#include <dbvh/core/threadPool.hpp>
#include <dbvh/containers/bvhSnapshot.hpp>

#include "world.hpp"

int main(int argc, char** argv) {
    using namespace dbvh;
    try {
        SandboxConfig config;
        if (argc > 1)
            LoadConfigFile(argv[1], config);

        Debug::SetMinimumLevel(config.GetLogLevel());
        if (!config.logFile.empty() && !Debug::SetLogFile(config.logFile))
            DBVH_LOG_WARN("Não foi possível abrir '{}', usando o console.", config.logFile);

        ThreadPool pool(static_cast<size_t>(config.workerThreads));
        DiagnosticsManager diagnostics;
        sandbox::World world(config);

        world.Spawn(config.bodyCount);

        size_t pairs = 0;
        for (int frame = 0; frame < config.frameCount; ++frame) {
            diagnostics.BeginFrame();
            pairs = world.FixedUpdate(config.fixedDelta, pool, diagnostics);
            diagnostics.EndFrame();

            DBVH_LOG_DEBUG("Frame {}: {} pares vizinhos, altura {}.", frame, pairs, world.GetWorldSpace().GetHeight());
        }

        pool.Shutdown();

        auto& tree = world.GetWorldSpace();
        if (!tree.ValidateStructure())
            throw InvariantViolation("tree failed structural validation after the simulation");

        DBVH_LOG_SUCCESS("Simulação concluída: {} corpos, altura {}, {} nós, {} pares no último frame.",
                         tree.Count(), tree.GetHeight(), tree.GetNodeCount(), pairs);
        DBVH_LOG_INFO("Diagnóstico:\n{}", diagnostics.Summary());

        if (!config.snapshotPath.empty()) {
            const std::vector<uint8_t> bytes = snapshot::SaveSnapshot(tree);
            snapshot::WriteSnapshotFile(config.snapshotPath, bytes);
            DBVH_LOG_INFO("Snapshot gravado em '{}' ({} bytes).", config.snapshotPath, bytes.size());
        }
    } catch (const std::exception& e) {
        DBVH_LOG_ERROR("Exception: {}", e.what());
        return -1;
    }

    return 0;
}
