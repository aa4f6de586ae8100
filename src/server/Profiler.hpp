#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_map>

namespace gitmcp {
namespace server {

/**
 * Profiler - aggregates execution times per operation (HTTP routes, tool calls)
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        size_t failures = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
    };

    static Profiler& instance();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    // Record one completed measurement
    void record(const std::string& name, double durationMs, bool failed = false);

    Stats getStats(const std::string& name) const;
    std::unordered_map<std::string, Stats> getAllStats() const;
    void reset();

    // Table sorted by total time, printed at shutdown
    std::string formatStats() const;

    // {"<operation>": {"count":..,"failures":..,"avgMs":..,"maxMs":..}}
    nlohmann::json toJson() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::atomic<bool> m_enabled{true};
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Stats> m_stats;
};

/**
 * RAII scoped timer - records into the Profiler when destroyed.
 * Call markFailed() on error paths so the failure is counted.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : m_name(std::move(name))
        , m_start(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void markFailed() { m_failed = true; }

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start).count();
            Profiler::instance().record(m_name, m_duration, m_failed);
        }
        return m_duration;
    }

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_stopped = false;
    bool m_failed = false;
    double m_duration = 0.0;
};

} // namespace server
} // namespace gitmcp
