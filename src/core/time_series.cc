// src/core/time_series.cc
#include "time_series.hh"

#include <algorithm>

TimeSeries::TimeSeries(const std::string& n, SimContext* ctx)
    : Entity(n, ctx) {
    addOutput("PresentValue", [this](double t) -> json { return getValue(t); });
}

void TimeSeries::configure(const json& cfg) {
    Entity::configure(cfg);
    times.clear();
    values.clear();
    if (!cfg.contains("times") || !cfg.contains("values")) {
        throw InputErrorException("Missing required input: times/values");
    }
    for (const auto& t : cfg["times"]) times.push_back(t.get<double>());
    for (const auto& v : cfg["values"]) values.push_back(v.get<double>());
    cycle_time = cfg.value("cycle_time", 0.0);
}

void TimeSeries::validate() {
    Entity::validate();
    if (times.empty() || times.size() != values.size()) {
        throw InputErrorException("times and values must be non-empty and of equal length");
    }
    if (times[0] != 0.0) {
        throw InputErrorException("The first time must be zero");
    }
    for (size_t i = 1; i < times.size(); ++i) {
        if (times[i] <= times[i - 1]) {
            throw InputErrorException("times must be strictly increasing");
        }
    }
    if (cycle_time < 0.0 || (cycle_time > 0.0 && cycle_time <= times.back())) {
        throw InputErrorException("cycle_time must be larger than the last time");
    }
}

void TimeSeries::earlyInit() {
    Entity::earlyInit();
    tick_times.clear();
    for (double t : times) {
        tick_times.push_back(event_manager->secondsToNearestTick(t));
    }
    cycle_ticks = event_manager->secondsToNearestTick(cycle_time);
}

size_t TimeSeries::indexForTicks(Tick ticks) const {
    if (ticks < 0) ticks = 0;
    if (cycle_ticks > 0) ticks %= cycle_ticks;
    // 最后一个不晚于 ticks 的点
    auto it = std::upper_bound(tick_times.begin(), tick_times.end(), ticks);
    return static_cast<size_t>(it - tick_times.begin()) - 1;
}

double TimeSeries::getValueForTicks(Tick ticks) const {
    if (tick_times.empty()) {
        error("Time series used before initialisation");
    }
    return values[indexForTicks(ticks)];
}

double TimeSeries::getValue(double simTime) const {
    return getValueForTicks(event_manager->secondsToNearestTick(simTime));
}

Tick TimeSeries::getNextChangeAfterTicks(Tick ticks) const {
    if (ticks < 0) return 0;
    Tick base = 0;
    Tick local = ticks;
    if (cycle_ticks > 0) {
        base = (ticks / cycle_ticks) * cycle_ticks;
        local = ticks - base;
    }
    auto it = std::upper_bound(tick_times.begin(), tick_times.end(), local);
    if (it != tick_times.end()) return base + *it;
    if (cycle_ticks > 0) return base + cycle_ticks;
    return MAX_TICK;
}

Tick TimeSeries::getMaxTicksValue() const {
    if (cycle_ticks > 0) return cycle_ticks;
    return tick_times.empty() ? 0 : tick_times.back();
}

double TimeSeries::getMinValue() const {
    return *std::min_element(values.begin(), values.end());
}

double TimeSeries::getMaxValue() const {
    return *std::max_element(values.begin(), values.end());
}
