#pragma once
#include <fmt/core.h>
#include "dbvh/core/errors.hpp"

namespace dbvh {

    template <typename ConfigT>
    void LoadConfig(const nlohmann::json& j, ConfigT& config)
    {
        if (!j.is_object())
            throw ConfigError("configuration root must be a JSON object");

        // Trabalha numa cópia: config só muda se tudo for válido
        ConfigT candidate = config;
        try {
            candidate.Deserialize(j);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(fmt::format("invalid configuration field: {}", e.what()));
        }

        candidate.Validate();
        config = std::move(candidate);
    }

    template <typename ConfigT>
    void LoadConfigFile(const std::filesystem::path& path, ConfigT& config)
    {
        LoadConfig(ReadJsonFile(path), config);
        DBVH_LOG_INFO("Configuração carregada de '{}'.", path.string());
    }

} // namespace dbvh
