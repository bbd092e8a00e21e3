/**
 * @file profile.hpp
 * @brief Scope timer for the frame loop, checked against the frame budget
 *
 * Sections are named scopes (a system update, the executor drain, a whole
 * tick). Each keeps its call count, total and worst duration, and how many
 * calls ran longer than the frame budget. Set the budget to one tick
 * (SystemConfig::SecondsPerTick) to spot work that would drop AR frames.
 *
 * @code
 * void BoundarySystem::update(entt::registry &registry) {
 *     PROFILE_SCOPE("BoundarySystem");
 *     ...
 * }
 * @endcode
 *
 * Only the game-state thread may open sections.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    struct SectionStats {
        std::uint64_t calls = 0;
        Duration total{0};
        Duration worst{0};
        std::uint64_t overBudget = 0;  ///< Calls longer than the frame budget
    };

    /**
     * @brief Sets the per-call limit counted in SectionStats::overBudget
     *
     * Zero disables the check. Applies to calls that end after this point.
     */
    static void setFrameBudget(double seconds);

    static void beginSection(const std::string& name);

    /**
     * @brief Closes the innermost open section
     *
     * A name that does not match the innermost section is reported on
     * stderr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Statistics of one section; all zero if it never ran
     */
    static SectionStats getStats(const std::string& name);

    /**
     * @brief Writes one line per section to stdout, most total time first
     */
    static void printStats();

    static void reset();

private:
    struct OpenSection {
        std::string name;
        Clock::time_point started;
    };

    Profiler() = default;

    static Profiler& instance();

    Duration frameBudget{0};
    std::unordered_map<std::string, SectionStats> stats;
    std::vector<OpenSection> open;
};

/**
 * @brief Times its own lifetime as one call of a section
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(scopedProfiler_, __LINE__) { name }
