// include/time_series.hh
#ifndef TIME_SERIES_HH
#define TIME_SERIES_HH

#include "entity.hh"
#include <vector>

/**
 * 分段常数的时间序列：times[i] 起取值 values[i]
 * cycle_time > 0 时按周期重复
 */
class TimeSeries : public Entity {
private:
    std::vector<double> times;     // 秒，首点必须为 0
    std::vector<double> values;
    double cycle_time = 0.0;

    std::vector<Tick> tick_times;
    Tick cycle_ticks = 0;

    size_t indexForTicks(Tick ticks) const;

public:
    TimeSeries(const std::string& n, SimContext* ctx);

    void configure(const json& cfg) override;
    void validate() override;
    void earlyInit() override;

    double getValueForTicks(Tick ticks) const;
    double getValue(double simTime) const;

    // ticks 之后下一个取值点，没有则为 MAX_TICK
    Tick getNextChangeAfterTicks(Tick ticks) const;

    // 一个周期的长度（或最后一个点的时刻）
    Tick getMaxTicksValue() const;

    double getMinValue() const;
    double getMaxValue() const;
};

#endif // TIME_SERIES_HH
