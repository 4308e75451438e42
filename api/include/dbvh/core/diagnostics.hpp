#pragma once
#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <algorithm>
#include <limits>
#include <chrono>
#include <mutex>
#include <atomic>
#include <exception>
#include <utility>
#include <fmt/core.h>

namespace dbvh {

    class HighResolutionTimer {
    public:
        HighResolutionTimer() : m_start(Now()), m_end(m_start) {}

        void Start() { m_start = Now(); }
        void End()   { m_end = Now(); }

        [[nodiscard]] double GetElapsedMilliseconds() const {
            return static_cast<double>(m_end - m_start) * 1e-3; // micros → ms
        }

        static uint64_t Now() {
            using namespace std::chrono;
            return duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
        }

    private:
        uint64_t m_start;
        uint64_t m_end;
    };

    // ---------------------------
    // TimerSampler: coleta e processa samples
    // ---------------------------
    class TimerSampler {
    public:
        void AddSample(double milliseconds) {
            m_sampleCount++;
            m_total += milliseconds;

            if (milliseconds < m_min) m_min = milliseconds;
            if (milliseconds > m_max) m_max = milliseconds;

            m_average = m_total / static_cast<double>(m_sampleCount);
        }

        double GetAverage() const { return m_average; }
        double GetMin() const { return m_sampleCount ? m_min : 0.0; }
        double GetMax() const { return m_max; }
        double GetTotal() const { return m_total; }
        size_t GetSampleCount() const { return m_sampleCount; }

    private:
        double m_total = 0.0;
        double m_average = 0.0;
        double m_min = std::numeric_limits<double>::max();
        double m_max = 0.0;
        size_t m_sampleCount = 0;
    };

    // ---------------------------
    // DiagnosticsManager: timers nomeados, seguro entre threads
    // ---------------------------
    class DiagnosticsManager {
    public:
        void BeginFrame() { m_frameTimer.Start(); }

        void EndFrame() {
            m_frameTimer.End();
            AddSample("frame", m_frameTimer.GetElapsedMilliseconds());

            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_totalFrames;
        }

        void AddSample(const std::string& name, double milliseconds) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_timerSamplers[name].AddSample(milliseconds);
        }

        // Amostra que não pôde ser registrada (ex.: sem memória para a chave)
        void NoteDroppedSample() noexcept { m_droppedSamples.fetch_add(1, std::memory_order_relaxed); }
        uint64_t GetDroppedSamples() const noexcept { return m_droppedSamples.load(std::memory_order_relaxed); }

        uint64_t GetTotalFrames() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_totalFrames;
        }

        // Cópia: o sampler pode mudar em outra thread
        TimerSampler GetTimerSampler(const std::string& name) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_timerSamplers.find(name);
            return (it != m_timerSamplers.end()) ? it->second : TimerSampler{};
        }

        // resumo em string
        std::string Summary() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::string out = fmt::format("Frames: {}\n", m_totalFrames);
            if (const uint64_t dropped = GetDroppedSamples(); dropped > 0)
                out += fmt::format("  amostras perdidas: {}\n", dropped);
            for (const auto& [name, sampler] : m_timerSamplers) {
                out += fmt::format("  {:<10} : {:8.3f} ms (min {:.3f}, max {:.3f}, n {})\n",
                                   name, sampler.GetAverage(), sampler.GetMin(), sampler.GetMax(),
                                   sampler.GetSampleCount());
            }
            return out;
        }

    private:
        mutable std::mutex m_mutex;
        HighResolutionTimer m_frameTimer;
        uint64_t m_totalFrames = 0;
        std::map<std::string, TimerSampler> m_timerSamplers;
        std::atomic<uint64_t> m_droppedSamples{ 0 };
    };

    // ---------------------------
    // ScopedTimer: registra o tempo do escopo no DiagnosticsManager
    // ---------------------------
    class ScopedTimer {
    public:
        ScopedTimer(DiagnosticsManager& diagnostics, std::string name)
            : m_diagnostics(diagnostics), m_name(std::move(name)) { m_timer.Start(); }

        ~ScopedTimer() noexcept {
            m_timer.End();
            try {
                m_diagnostics.AddSample(m_name, m_timer.GetElapsedMilliseconds());
            } catch (const std::exception&) {
                // destrutor não pode propagar; a perda fica contada
                m_diagnostics.NoteDroppedSample();
            }
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        DiagnosticsManager& m_diagnostics;
        std::string m_name;
        HighResolutionTimer m_timer;
    };

} // namespace dbvh
