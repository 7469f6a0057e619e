// include/time_series_threshold.hh
#ifndef TIME_SERIES_THRESHOLD_HH
#define TIME_SERIES_THRESHOLD_HH

#include "threshold.hh"
#include "time_series.hh"

// 开启上下限：常数或时间序列
struct TimeSeriesLimit {
    TimeSeries* series = nullptr;
    double constant = 0.0;

    double getValueForTicks(Tick ticks) const {
        return series ? series->getValueForTicks(ticks) : constant;
    }
    Tick getNextChangeAfterTicks(Tick ticks) const {
        return series ? series->getNextChangeAfterTicks(ticks) : MAX_TICK;
    }
    double getMinValue() const { return series ? series->getMinValue() : constant; }
    double getMaxValue() const { return series ? series->getMaxValue() : constant; }
};

/**
 * 时间序列值落在 [min_open_limit, max_open_limit] 内时开启
 * 在每个取值点重新判断；运行中上下限交叉是致命错误
 */
class TimeSeriesThreshold : public Threshold {
private:
    TimeSeries* time_series = nullptr;
    TimeSeriesLimit min_open_limit;
    TimeSeriesLimit max_open_limit;
    double offset = 0.0;

    EntityTarget<TimeSeriesThreshold> open_close_target;
    EventHandle open_close_handle;

    TimeSeriesLimit getLimitInput(const json& cfg, const std::string& key, double def);
    Tick getNextChangeAfterTicks(Tick ticks) const;
    Tick getOffsetTicks() const;

public:
    TimeSeriesThreshold(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void startUp() override;
    void kill() override;

    void doOpenClose();

    bool isPointOpenAtTicks(Tick ticks) const;
    bool isOpenAtTime(double simTime) const;
};

#endif // TIME_SERIES_THRESHOLD_HH
