// src/core/sample_provider.cc
#include "sample_provider.hh"
#include "sim_context.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

SampleSequence::SampleSequence(std::vector<double> v) : values(std::move(v)) {
    if (values.empty()) {
        throw InputErrorException("Sample sequence must contain at least one value");
    }
}

double SampleSequence::getNextSample(double simTime) {
    double ret = values[index];
    index = (index + 1) % values.size();
    return ret;
}

double SampleSequence::getMinValue() const {
    return *std::min_element(values.begin(), values.end());
}

double SampleSequence::getMaxValue() const {
    return *std::max_element(values.begin(), values.end());
}

double SampleSequence::getMeanValue(double simTime) const {
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

RandomDistribution::RandomDistribution(uint32_t seed, int stream) {
    std::seed_seq seq{seed, static_cast<uint32_t>(stream)};
    rng.seed(seq);
}

UniformDistribution::UniformDistribution(double lo, double hi, uint32_t seed, int stream)
    : RandomDistribution(seed, stream), min_value(lo), max_value(hi) {
    if (hi < lo) {
        throw InputErrorException("Uniform distribution: max must not be less than min");
    }
}

double UniformDistribution::getNextSample(double simTime) {
    return min_value + (max_value - min_value) * nextUniform();
}

ExponentialDistribution::ExponentialDistribution(double m, uint32_t seed, int stream)
    : RandomDistribution(seed, stream), mean(m) {
    if (!(m > 0.0)) {
        throw InputErrorException("Exponential distribution: mean must be positive");
    }
}

double ExponentialDistribution::getNextSample(double simTime) {
    // 1 - u 落在 (0, 1]
    return -mean * std::log(1.0 - nextUniform());
}

double ExponentialDistribution::getMaxValue() const {
    return std::numeric_limits<double>::infinity();
}

TriangularDistribution::TriangularDistribution(double lo, double m, double hi, uint32_t seed, int stream)
    : RandomDistribution(seed, stream), min_value(lo), mode(m), max_value(hi) {
    if (!(lo <= m && m <= hi) || lo == hi) {
        throw InputErrorException("Triangular distribution: requires min <= mode <= max and min < max");
    }
}

double TriangularDistribution::getNextSample(double simTime) {
    // 逆变换采样
    double u = nextUniform();
    double range = max_value - min_value;
    double fc = (mode - min_value) / range;
    if (u < fc) {
        return min_value + std::sqrt(u * range * (mode - min_value));
    }
    return max_value - std::sqrt((1.0 - u) * range * (max_value - mode));
}

static double getNumber(const json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_number()) {
        throw InputErrorException(std::string("Missing numeric value: ") + key);
    }
    return obj[key].get<double>();
}

std::unique_ptr<SampleProvider> makeSampleProvider(const json& val, SimContext* ctx) {
    if (val.is_number()) {
        return std::make_unique<SampleConstant>(val.get<double>());
    }

    if (val.is_array()) {
        std::vector<double> values;
        for (const auto& v : val) {
            if (!v.is_number()) throw InputErrorException("Sample sequence values must be numbers");
            values.push_back(v.get<double>());
        }
        return std::make_unique<SampleSequence>(std::move(values));
    }

    if (!val.is_object() || !val.contains("distribution")) {
        throw InputErrorException("Expected a number, a list of numbers or a distribution: " + val.dump());
    }

    std::string kind = val["distribution"].get<std::string>();
    uint32_t seed = ctx->getRandomSeed();
    int stream = val.contains("stream") ? val["stream"].get<int>() : ctx->getNextStreamNumber();

    if (kind == "constant") {
        return std::make_unique<SampleConstant>(getNumber(val, "value"));
    }
    if (kind == "uniform") {
        return std::make_unique<UniformDistribution>(getNumber(val, "min"), getNumber(val, "max"), seed, stream);
    }
    if (kind == "exponential") {
        return std::make_unique<ExponentialDistribution>(getNumber(val, "mean"), seed, stream);
    }
    if (kind == "triangular") {
        return std::make_unique<TriangularDistribution>(
            getNumber(val, "min"), getNumber(val, "mode"), getNumber(val, "max"), seed, stream);
    }
    throw InputErrorException("Unknown distribution: " + kind);
}
