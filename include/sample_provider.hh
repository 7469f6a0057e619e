// include/sample_provider.hh
#ifndef SAMPLE_PROVIDER_HH
#define SAMPLE_PROVIDER_HH

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

using json = nlohmann::json;

class SimContext;

/**
 * 数值来源：常数、序列或概率分布
 * 调用方只依赖 getNextSample(simTime)
 */
class SampleProvider {
public:
    virtual ~SampleProvider() = default;
    virtual double getNextSample(double simTime) = 0;
    virtual double getMinValue() const = 0;
    virtual double getMaxValue() const = 0;
    virtual double getMeanValue(double simTime) const = 0;
};

class SampleConstant : public SampleProvider {
private:
    double value;

public:
    explicit SampleConstant(double v) : value(v) {}
    double getNextSample(double simTime) override { return value; }
    double getMinValue() const override { return value; }
    double getMaxValue() const override { return value; }
    double getMeanValue(double simTime) const override { return value; }
};

// 依次返回给定值，用完后从头循环
class SampleSequence : public SampleProvider {
private:
    std::vector<double> values;
    size_t index = 0;

public:
    explicit SampleSequence(std::vector<double> v);
    double getNextSample(double simTime) override;
    double getMinValue() const override;
    double getMaxValue() const override;
    double getMeanValue(double simTime) const override;
};

// 随机分布的公共部分：独立的随机流 (seed, stream)
class RandomDistribution : public SampleProvider {
protected:
    std::mt19937_64 rng;
    std::uniform_real_distribution<double> unit{0.0, 1.0};

    double nextUniform() { return unit(rng); }

public:
    RandomDistribution(uint32_t seed, int stream);
};

class UniformDistribution : public RandomDistribution {
private:
    double min_value;
    double max_value;

public:
    UniformDistribution(double lo, double hi, uint32_t seed, int stream);
    double getNextSample(double simTime) override;
    double getMinValue() const override { return min_value; }
    double getMaxValue() const override { return max_value; }
    double getMeanValue(double simTime) const override { return 0.5 * (min_value + max_value); }
};

class ExponentialDistribution : public RandomDistribution {
private:
    double mean;

public:
    ExponentialDistribution(double m, uint32_t seed, int stream);
    double getNextSample(double simTime) override;
    double getMinValue() const override { return 0.0; }
    double getMaxValue() const override;
    double getMeanValue(double simTime) const override { return mean; }
};

class TriangularDistribution : public RandomDistribution {
private:
    double min_value;
    double mode;
    double max_value;

public:
    TriangularDistribution(double lo, double m, double hi, uint32_t seed, int stream);
    double getNextSample(double simTime) override;
    double getMinValue() const override { return min_value; }
    double getMaxValue() const override { return max_value; }
    double getMeanValue(double simTime) const override { return (min_value + mode + max_value) / 3.0; }
};

/**
 * 从 JSON 创建 SampleProvider
 *   3.5                                        -> 常数
 *   [1, 2, 3]                                  -> 序列
 *   {"distribution": "uniform", "min": 0, "max": 1}
 *   {"distribution": "exponential", "mean": 2}
 *   {"distribution": "triangular", "min": 0, "mode": 1, "max": 3}
 * 随机分布可用 "stream" 指定随机流，否则由 SimContext 分配
 * 输入不合法时抛出 InputErrorException
 */
std::unique_ptr<SampleProvider> makeSampleProvider(const json& val, SimContext* ctx);

#endif // SAMPLE_PROVIDER_HH
