#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "dbvh/core/serializable.hpp"
#include "dbvh/core/debug.hpp"

namespace dbvh {

    /**
     * @brief Tuning knobs of DynamicBVH.
     */
    struct TreeConfig : Serializable<TreeConfig> {
        /// Slots reserved in the node arena up front.
        int initialCapacity = 64;

        /// Maximum SubtreeSize difference between siblings before descent is forced into the smaller one.
        int balanceThreshold = 2;

        /// Relative tolerance under which two insertion costs count as equal.
        double costTolerance = 0.05;

        /// @throws ConfigError on negative values.
        void Validate() const;

        static void DescribeFields() {
            RegisterField("initialCapacity", &TreeConfig::initialCapacity);
            RegisterField("balanceThreshold", &TreeConfig::balanceThreshold);
            RegisterField("costTolerance", &TreeConfig::costTolerance);
        }
    };

    /**
     * @brief Settings of the dbvh_sandbox executable.
     */
    struct SandboxConfig : Serializable<SandboxConfig> {
        TreeConfig tree;

        int bodyCount = 2000;
        int frameCount = 120;
        float worldExtent = 500.0f;     // mundo = cubo [-extent, extent]
        float maxSpeed = 25.0f;         // unidades por segundo
        float bodyHalfExtent = 2.0f;
        float queryRadius = 10.0f;
        double fixedDelta = 1.0 / 60.0;
        int workerThreads = 4;
        uint32_t seed = 1337;

        std::string logLevel = "info";
        std::string logFile;            // vazio = console
        std::string snapshotPath;       // vazio = não grava snapshot

        void Validate() const;

        /// Converte logLevel; lança ConfigError se inválido.
        LogLevel GetLogLevel() const;

        static void DescribeFields() {
            RegisterField("tree", &SandboxConfig::tree);
            RegisterField("bodyCount", &SandboxConfig::bodyCount);
            RegisterField("frameCount", &SandboxConfig::frameCount);
            RegisterField("worldExtent", &SandboxConfig::worldExtent);
            RegisterField("maxSpeed", &SandboxConfig::maxSpeed);
            RegisterField("bodyHalfExtent", &SandboxConfig::bodyHalfExtent);
            RegisterField("queryRadius", &SandboxConfig::queryRadius);
            RegisterField("fixedDelta", &SandboxConfig::fixedDelta);
            RegisterField("workerThreads", &SandboxConfig::workerThreads);
            RegisterField("seed", &SandboxConfig::seed);
            RegisterField("logLevel", &SandboxConfig::logLevel);
            RegisterField("logFile", &SandboxConfig::logFile);
            RegisterField("snapshotPath", &SandboxConfig::snapshotPath);
        }
    };

    /**
     * @brief Parse a JSON document into @p config and validate it.
     * @throws ConfigError on parse errors, type mismatches or invalid values.
     */
    template <typename ConfigT>
    void LoadConfig(const nlohmann::json& j, ConfigT& config);

    /**
     * @brief Read and parse a JSON file into @p config.
     * @throws ConfigError if the file cannot be read or is not valid.
     */
    template <typename ConfigT>
    void LoadConfigFile(const std::filesystem::path& path, ConfigT& config);

    /// Lê o arquivo inteiro e faz o parse. Lança ConfigError.
    nlohmann::json ReadJsonFile(const std::filesystem::path& path);

} // namespace dbvh

#include "config.inl"
