/**
 * @file profile.cpp
 * @brief Implementation of the profiling system described in profile.hpp
 */

#include "puffer/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>
#include <vector>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    instance.sections[name].start_time = Clock::now();
    instance.scope_stack.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") but scope stack empty.\n";
        return;
    }
    if (instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but top of stack is \"" << instance.scope_stack.top() << "\".\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const duration = Clock::now() - instance.sections[name].start_time;

    data.total_time += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);

    instance.scope_stack.pop();
}

void Profiler::printStats() {
    auto& instance = getInstance();

    std::vector<std::pair<std::string, ProfileData>> rows;
    rows.reserve(instance.sections.size());
    for (const auto& [name, section] : instance.sections) {
        rows.emplace_back(name, section.profile_data);
    }
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, pd] : rows) {
        using Micros = std::chrono::duration<double, std::micro>;
        double const totalUs = Micros(pd.total_time).count();
        double const avgUs = pd.call_count > 0 ? totalUs / static_cast<double>(pd.call_count) : 0.0;
        std::cout << "  " << std::left << std::setw(28) << name
                  << " [" << pd.call_count << " calls] "
                  << std::fixed << std::setprecision(2)
                  << totalUs << "us total, " << avgUs << "us avg\n";
    }
}

Profiler::ProfileData Profiler::getStats(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return {};
    }
    return it->second.profile_data;
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack = std::stack<std::string>();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
