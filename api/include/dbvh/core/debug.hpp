#pragma once

#include <string>
#include <string_view>
#include <fmt/core.h>
#include <fmt/std.h>
#include <ostream>
#include <fstream>
#include <memory>
#include <mutex>
#include <atomic>

namespace dbvh {
    /**
    * @enum LogLevel
    * @brief Severity levels, ordered from the most verbose to the most severe.
    */
    enum class LogLevel {
        Debug,
        Info,
        Success,
        Warn,
        Error
    };

    /// Converte "debug" / "info" / "success" / "warn" / "error" para LogLevel.
    /// Retorna false se o texto nao for reconhecido.
    bool ParseLogLevel(std::string_view text, LogLevel& outLevel);

    /// Nome curto do nivel (ex: "WARN").
    const char* ToString(LogLevel level);

    /**
     * @class Debug
     * @brief Static logger with colours, levels and configurable output.
     *
     * - Debug builds show Info and above by default, release builds Warn and above.
     * - The minimum level can be changed at runtime with SetMinimumLevel().
     * - Thread-safe: a single mutex serializes every write.
     */
    class Debug {
    public:
        /// Ativa ou desativa cores ANSI.
        static void SetColorEnabled(bool enabled);

        /// Define o nível mínimo exibido nos logs.
        static void SetMinimumLevel(LogLevel level);

        static LogLevel GetMinimumLevel();

        /// Define se deve dar flush após cada log.
        static void SetAutoFlush(bool enabled);

        /// Define saída para arquivo (substitui stdout).
        /// Returns false if the file could not be opened; output stays unchanged.
        static bool SetLogFile(const std::string& filepath);

        /// Redirects output to an arbitrary stream (not owned). Used by tests.
        static void SetOutputStream(std::ostream* stream);

        /// Reseta saída para console padrão.
        static void ResetOutputToConsole();

        static bool IsEnabled(LogLevel level) { return level >= GetMinimumLevel(); }

        /// Log genérico com formatação.
        template <typename... Args>
        static void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
            if (!IsEnabled(level)) return;

            const std::string msg = fmt::format(format, std::forward<Args>(args)...);
            Print(level, msg);
        }

        /// Função interna para exibir mensagem com formatação final.
        static void Print(LogLevel level, const std::string& message);

    private:
        static inline bool g_colorEnabled = true;
        static inline bool g_autoFlush = true;
        static inline std::atomic<LogLevel> g_minLevel =
    #ifndef NDEBUG
            LogLevel::Info;
    #else
            LogLevel::Warn;
    #endif

        static inline std::ostream* g_outputStream = nullptr;
        static inline std::unique_ptr<std::ofstream> g_fileStream;
        static inline std::mutex g_mutex;
    };
}

// ------------------- Macros para uso simplificado -------------------
#define DBVH_LOG_DEBUG(fmt_str, ...)   ::dbvh::Debug::Log(::dbvh::LogLevel::Debug, fmt_str, ##__VA_ARGS__)
#define DBVH_LOG_INFO(fmt_str, ...)    ::dbvh::Debug::Log(::dbvh::LogLevel::Info, fmt_str, ##__VA_ARGS__)
#define DBVH_LOG_SUCCESS(fmt_str, ...) ::dbvh::Debug::Log(::dbvh::LogLevel::Success, fmt_str, ##__VA_ARGS__)
#define DBVH_LOG_WARN(fmt_str, ...)    ::dbvh::Debug::Log(::dbvh::LogLevel::Warn, fmt_str, ##__VA_ARGS__)
#define DBVH_LOG_ERROR(fmt_str, ...)   ::dbvh::Debug::Log(::dbvh::LogLevel::Error, fmt_str, ##__VA_ARGS__)
