/**
 * @file profile.hpp
 * @brief Scope timing for the simulation systems
 *
 * Example usage:
 * @code
 * void ProjectileSystem::update(entt::registry& registry) {
 *     PROFILE_SCOPE("ProjectileSystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stack>
#include <string>
#include <unordered_map>

namespace Profiling {

/**
 * @brief Singleton that aggregates timing data per named scope.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named scope
     */
    struct ProfileData {
        Duration total_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Start timing a named scope.
     * @param name The scope's name (must be ended with endSection).
     */
    static void startSection(const std::string& name);

    /**
     * @brief End timing a named scope.
     * @param name Must match the most recent startSection.
     */
    static void endSection(const std::string& name);

    /** @brief Print one line per scope to stdout, slowest first. */
    static void printStats();

    /** @brief Look up the statistics for a scope (zeroed if never entered). */
    static ProfileData getStats(const std::string& name);

    /** @brief Clear all recorded profiling data. */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard that times the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    // No copy allowed
    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
