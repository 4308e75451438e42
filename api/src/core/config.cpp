#include "dbvh/core/config.hpp"
#include "dbvh/core/errors.hpp"

#include <fstream>
#include <fmt/core.h>

namespace dbvh {

    void TreeConfig::Validate() const
    {
        if (initialCapacity < 0)
            throw ConfigError(fmt::format("tree.initialCapacity must be >= 0 (got {})", initialCapacity));
        if (balanceThreshold < 0)
            throw ConfigError(fmt::format("tree.balanceThreshold must be >= 0 (got {})", balanceThreshold));
        if (!(costTolerance >= 0.0))
            throw ConfigError(fmt::format("tree.costTolerance must be >= 0 (got {})", costTolerance));
    }

    void SandboxConfig::Validate() const
    {
        tree.Validate();

        if (bodyCount < 0)
            throw ConfigError(fmt::format("bodyCount must be >= 0 (got {})", bodyCount));
        if (frameCount < 0)
            throw ConfigError(fmt::format("frameCount must be >= 0 (got {})", frameCount));
        if (!(worldExtent > 0.0f))
            throw ConfigError(fmt::format("worldExtent must be > 0 (got {})", worldExtent));
        if (!(bodyHalfExtent > 0.0f) || bodyHalfExtent * 2.0f > worldExtent)
            throw ConfigError(fmt::format("bodyHalfExtent must be in (0, worldExtent/2] (got {})", bodyHalfExtent));
        if (maxSpeed < 0.0f || queryRadius < 0.0f)
            throw ConfigError("maxSpeed and queryRadius must be >= 0");
        if (!(fixedDelta > 0.0))
            throw ConfigError(fmt::format("fixedDelta must be > 0 (got {})", fixedDelta));
        if (workerThreads < 1)
            throw ConfigError(fmt::format("workerThreads must be >= 1 (got {})", workerThreads));

        GetLogLevel();
    }

    LogLevel SandboxConfig::GetLogLevel() const
    {
        LogLevel level;
        if (!ParseLogLevel(logLevel, level))
            throw ConfigError(fmt::format("unknown logLevel '{}'", logLevel));
        return level;
    }

    nlohmann::json ReadJsonFile(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigError(fmt::format("cannot open configuration file '{}'", path.string()));

        try {
            return nlohmann::json::parse(file, nullptr, true, true);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(fmt::format("cannot parse '{}': {}", path.string(), e.what()));
        }
    }

} // namespace dbvh
