#include "pingpong/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

namespace {
    double toMicros(Profiler::Duration d) {
        return std::chrono::duration<double, std::micro>(d).count();
    }
}

Profiler& Profiler::instance() {
    static Profiler profiler;
    return profiler;
}

void Profiler::setFrameBudget(double seconds) {
    auto const budget = std::chrono::duration<double>(seconds > 0.0 ? seconds : 0.0);
    instance().frameBudget = std::chrono::duration_cast<Duration>(budget);
}

void Profiler::beginSection(const std::string& name) {
    instance().open.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& self = instance();
    auto const now = Clock::now();

    if (self.open.empty() || self.open.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") does not match "
                  << (self.open.empty() ? std::string("any open section")
                                        : "\"" + self.open.back().name + "\"")
                  << std::endl;
        return;
    }

    Duration const elapsed = std::chrono::duration_cast<Duration>(now - self.open.back().started);
    self.open.pop_back();

    SectionStats& s = self.stats[name];
    s.calls += 1;
    s.total += elapsed;
    s.worst = std::max(s.worst, elapsed);
    if (self.frameBudget.count() > 0 && elapsed > self.frameBudget) {
        s.overBudget += 1;
    }
}

Profiler::SectionStats Profiler::getStats(const std::string& name) {
    auto& self = instance();
    auto it = self.stats.find(name);
    return it == self.stats.end() ? SectionStats{} : it->second;
}

void Profiler::printStats() {
    auto& self = instance();

    std::vector<std::pair<std::string, SectionStats>> rows(self.stats.begin(), self.stats.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total > b.second.total;
    });

    std::cout << "\nProfile";
    if (self.frameBudget.count() > 0) {
        std::cout << " (frame budget " << std::fixed << std::setprecision(1)
                  << toMicros(self.frameBudget) << "us)";
    }
    std::cout << ":\n";

    for (const auto& [name, s] : rows) {
        std::cout << "  " << std::left << std::setw(30) << name << std::right
                  << std::setw(8) << s.calls << " calls "
                  << std::fixed << std::setprecision(1)
                  << std::setw(9) << toMicros(s.total) / static_cast<double>(s.calls) << "us avg "
                  << std::setw(9) << toMicros(s.worst) << "us worst";
        if (s.overBudget > 0) {
            std::cout << "  " << s.overBudget << " over budget";
        }
        std::cout << "\n";
    }
}

void Profiler::reset() {
    auto& self = instance();
    self.stats.clear();
    self.open.clear();
}

ScopedProfiler::ScopedProfiler(std::string sectionName) : name(std::move(sectionName)) {
    Profiler::beginSection(name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(name);
}

} // namespace Profiling
