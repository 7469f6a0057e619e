// src/core/time_series_threshold.cc
#include "time_series_threshold.hh"
#include "utils/config_utils.hh"

#include <algorithm>
#include <limits>

TimeSeriesThreshold::TimeSeriesThreshold(const std::string& n, SimContext* ctx)
    : Threshold(n, ctx), open_close_target(this, &TimeSeriesThreshold::doOpenClose, "doOpenClose") {}

TimeSeriesLimit TimeSeriesThreshold::getLimitInput(const json& cfg, const std::string& key, double def) {
    TimeSeriesLimit limit;
    limit.constant = def;
    if (!cfg.contains(key) || cfg[key].is_null()) return limit;
    if (cfg[key].is_number()) {
        limit.constant = cfg[key].get<double>();
    } else {
        limit.series = getEntityInput<TimeSeries>(context, cfg, key, true);
    }
    return limit;
}

void TimeSeriesThreshold::configure(const json& cfg) {
    Threshold::configure(cfg);
    time_series = getEntityInput<TimeSeries>(context, cfg, "time_series", true);
    min_open_limit = getLimitInput(cfg, "min_open_limit", -std::numeric_limits<double>::infinity());
    max_open_limit = getLimitInput(cfg, "max_open_limit", std::numeric_limits<double>::infinity());
    offset = cfg.value("offset", 0.0);
}

void TimeSeriesThreshold::validate() {
    Threshold::validate();
    const double inf = std::numeric_limits<double>::infinity();
    if (max_open_limit.getMinValue() == inf && min_open_limit.getMaxValue() == -inf) {
        throw InputErrorException("Missing Limit");
    }
    if (min_open_limit.getMaxValue() > max_open_limit.getMaxValue()) {
        throw InputErrorException("MaxOpenLimit must be larger than MinOpenLimit");
    }
}

void TimeSeriesThreshold::startUp() {
    Threshold::startUp();
    doOpenClose();
}

void TimeSeriesThreshold::kill() {
    killEvent(&open_close_handle);
    Threshold::kill();
}

Tick TimeSeriesThreshold::getOffsetTicks() const {
    return event_manager->secondsToNearestTick(offset);
}

Tick TimeSeriesThreshold::getNextChangeAfterTicks(Tick ticks) const {
    Tick first = time_series->getNextChangeAfterTicks(ticks);
    first = std::min(first, max_open_limit.getNextChangeAfterTicks(ticks));
    first = std::min(first, min_open_limit.getNextChangeAfterTicks(ticks));
    return first;
}

bool TimeSeriesThreshold::isPointOpenAtTicks(Tick ticks) const {
    double value = time_series->getValueForTicks(ticks);
    double min_val = min_open_limit.getValueForTicks(ticks);
    double max_val = max_open_limit.getValueForTicks(ticks);

    if (min_val > max_val) {
        error("MaxOpenLimit must be larger than MinOpenLimit. MaxOpenLimit: %g, MinOpenLimit: %g, time: %g",
              max_val, min_val, event_manager->ticksToSeconds(ticks));
    }
    return value >= min_val && value <= max_val;
}

bool TimeSeriesThreshold::isOpenAtTime(double simTime) const {
    Tick ticks = std::max<Tick>(event_manager->secondsToNearestTick(simTime) + getOffsetTicks(), 0);
    return isPointOpenAtTicks(ticks);
}

void TimeSeriesThreshold::doOpenClose() {
    Tick ticks = std::max<Tick>(getSimTicks() + getOffsetTicks(), 0);
    setOpen(isPointOpenAtTicks(ticks));

    // 到下一个取值点再判断
    Tick next = getNextChangeAfterTicks(ticks);
    if (next == MAX_TICK) return;
    scheduleProcessTicks(next - ticks, 1, false, &open_close_target, &open_close_handle);
}
