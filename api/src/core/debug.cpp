#include "dbvh/core/debug.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace dbvh {
    namespace {
        const char* colorFor(LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return "\033[90m";
                case LogLevel::Info:    return "\033[36m";
                case LogLevel::Success: return "\033[32m";
                case LogLevel::Warn:    return "\033[33m";
                case LogLevel::Error:   return "\033[31m";
            }
            return "";
        }

        constexpr const char* kColorReset = "\033[0m";

        std::string timestamp() {
            using namespace std::chrono;
            const auto now = system_clock::now();
            const std::time_t t = system_clock::to_time_t(now);
            const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

            std::tm tm{};
        #ifdef _WIN32
            localtime_s(&tm, &t);
        #else
            localtime_r(&t, &tm);
        #endif
            char buffer[16];
            std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);
            return fmt::format("{}.{:03}", buffer, ms);
        }
    }

    bool ParseLogLevel(std::string_view text, LogLevel& outLevel) {
        if (text == "debug")   { outLevel = LogLevel::Debug;   return true; }
        if (text == "info")    { outLevel = LogLevel::Info;    return true; }
        if (text == "success") { outLevel = LogLevel::Success; return true; }
        if (text == "warn")    { outLevel = LogLevel::Warn;    return true; }
        if (text == "error")   { outLevel = LogLevel::Error;   return true; }
        return false;
    }

    const char* ToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Success: return "SUCCESS";
            case LogLevel::Warn:    return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "?";
    }

    void Debug::SetColorEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_colorEnabled = enabled;
    }

    void Debug::SetMinimumLevel(LogLevel level) {
        g_minLevel.store(level, std::memory_order_relaxed);
    }

    LogLevel Debug::GetMinimumLevel() {
        return g_minLevel.load(std::memory_order_relaxed);
    }

    void Debug::SetAutoFlush(bool enabled) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_autoFlush = enabled;
    }

    bool Debug::SetLogFile(const std::string& filepath) {
        auto file = std::make_unique<std::ofstream>(filepath, std::ios::out | std::ios::app);
        if (!file->is_open()) {
            Print(LogLevel::Error, fmt::format("Nao foi possivel abrir arquivo de log '{}'.", filepath));
            return false;
        }

        std::lock_guard<std::mutex> lock(g_mutex);
        g_fileStream = std::move(file);
        g_outputStream = g_fileStream.get();
        // Arquivo nao entende sequencias ANSI
        g_colorEnabled = false;
        return true;
    }

    void Debug::SetOutputStream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_outputStream = stream;
        g_fileStream.reset();
    }

    void Debug::ResetOutputToConsole() {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_outputStream = nullptr;
        g_fileStream.reset();
    }

    void Debug::Print(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(g_mutex);

        std::ostream& out = g_outputStream ? *g_outputStream
                          : (level >= LogLevel::Warn ? std::cerr : std::cout);

        if (g_colorEnabled)
            out << colorFor(level);

        out << '[' << timestamp() << "] [" << ToString(level) << "] " << message;

        if (g_colorEnabled)
            out << kColorReset;

        out << '\n';

        if (g_autoFlush)
            out.flush();
    }
}
