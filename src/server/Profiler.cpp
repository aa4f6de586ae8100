#include "server/Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace gitmcp {
namespace server {

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, double durationMs, bool failed) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    Stats& stats = m_stats[name];
    stats.count++;
    if (failed) stats.failures++;
    stats.totalMs += durationMs;
    stats.minMs = std::min(stats.minMs, durationMs);
    stats.maxMs = std::max(stats.maxMs, durationMs);
}

Profiler::Stats Profiler::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(name);
    if (it != m_stats.end()) {
        return it->second;
    }
    return Stats{};
}

std::unordered_map<std::string, Profiler::Stats> Profiler::getAllStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
}

std::string Profiler::formatStats() const {
    std::vector<std::pair<std::string, Stats>> sorted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sorted.assign(m_stats.begin(), m_stats.end());
    }

    if (sorted.empty()) {
        return "No profiling data available.";
    }

    std::sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.second.totalMs > b.second.totalMs; });

    std::ostringstream oss;
    oss << "\n========== PROFILER STATS ==========\n";
    oss << std::left << std::setw(32) << "Operation"
        << std::right << std::setw(8) << "Count"
        << std::setw(8) << "Failed"
        << std::setw(12) << "Total(ms)"
        << std::setw(12) << "Avg(ms)"
        << std::setw(12) << "Max(ms)"
        << "\n";
    oss << std::string(84, '-') << "\n";

    for (const auto& [name, stats] : sorted) {
        oss << std::left << std::setw(32) << name
            << std::right << std::setw(8) << stats.count
            << std::setw(8) << stats.failures
            << std::setw(12) << std::fixed << std::setprecision(2) << stats.totalMs
            << std::setw(12) << stats.avgMs()
            << std::setw(12) << stats.maxMs
            << "\n";
    }
    oss << "====================================\n";

    return oss.str();
}

nlohmann::json Profiler::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, stats] : m_stats) {
        out[name] = {
            {"count", stats.count},
            {"failures", stats.failures},
            {"avgMs", stats.avgMs()},
            {"maxMs", stats.maxMs}
        };
    }
    return out;
}

} // namespace server
} // namespace gitmcp
