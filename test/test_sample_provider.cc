// test/test_sample_provider.cc
#include <gtest/gtest.h>
#include "../include/sample_provider.hh"
#include "../include/sim_context.hh"

TEST(SampleProviderTest, ConstantAndSequence) {
    SimContext ctx;
    auto c = makeSampleProvider(json(2.5), &ctx);
    EXPECT_DOUBLE_EQ(c->getNextSample(0), 2.5);
    EXPECT_DOUBLE_EQ(c->getMinValue(), 2.5);

    auto seq = makeSampleProvider(R"([3, 1, 2])"_json, &ctx);
    std::vector<double> got;
    for (int i = 0; i < 5; ++i) got.push_back(seq->getNextSample(0));
    EXPECT_EQ(got, (std::vector<double>{3, 1, 2, 3, 1}));
    EXPECT_DOUBLE_EQ(seq->getMinValue(), 1.0);
    EXPECT_DOUBLE_EQ(seq->getMaxValue(), 3.0);
    EXPECT_DOUBLE_EQ(seq->getMeanValue(0), 2.0);
}

TEST(SampleProviderTest, UniformWithinBoundsAndRepeatable) {
    SimContext ctx;
    json cfg = R"({"distribution": "uniform", "min": 2, "max": 4, "stream": 7})"_json;
    auto a = makeSampleProvider(cfg, &ctx);
    auto b = makeSampleProvider(cfg, &ctx);

    for (int i = 0; i < 1000; ++i) {
        double x = a->getNextSample(0);
        EXPECT_GE(x, 2.0);
        EXPECT_LE(x, 4.0);
        // 相同的种子和流号产生相同的序列
        EXPECT_DOUBLE_EQ(x, b->getNextSample(0));
    }
    EXPECT_DOUBLE_EQ(a->getMeanValue(0), 3.0);
}

TEST(SampleProviderTest, DifferentStreamsDiffer) {
    SimContext ctx;
    auto a = makeSampleProvider(R"({"distribution": "uniform", "min": 0, "max": 1})"_json, &ctx);
    auto b = makeSampleProvider(R"({"distribution": "uniform", "min": 0, "max": 1})"_json, &ctx);

    int same = 0;
    for (int i = 0; i < 100; ++i) {
        if (a->getNextSample(0) == b->getNextSample(0)) same++;
    }
    EXPECT_LT(same, 100);
}

TEST(SampleProviderTest, ExponentialMean) {
    SimContext ctx;
    auto e = makeSampleProvider(R"({"distribution": "exponential", "mean": 5, "stream": 1})"_json, &ctx);

    const int n = 20000;
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        double x = e->getNextSample(0);
        ASSERT_GE(x, 0.0);
        sum += x;
    }
    EXPECT_NEAR(sum / n, 5.0, 0.25);
}

TEST(SampleProviderTest, TriangularWithinBounds) {
    SimContext ctx;
    auto t = makeSampleProvider(R"({"distribution": "triangular", "min": 1, "mode": 2, "max": 6, "stream": 3})"_json, &ctx);

    const int n = 20000;
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        double x = t->getNextSample(0);
        ASSERT_GE(x, 1.0);
        ASSERT_LE(x, 6.0);
        sum += x;
    }
    EXPECT_NEAR(sum / n, 3.0, 0.1);
}

TEST(SampleProviderTest, InvalidInputRejected) {
    SimContext ctx;
    EXPECT_THROW(makeSampleProvider(R"({"distribution": "weibull", "scale": 1})"_json, &ctx), InputErrorException);
    EXPECT_THROW(makeSampleProvider(R"({"distribution": "uniform", "min": 4, "max": 2})"_json, &ctx), InputErrorException);
    EXPECT_THROW(makeSampleProvider(R"({"distribution": "exponential", "mean": 0})"_json, &ctx), InputErrorException);
    EXPECT_THROW(makeSampleProvider(R"({"distribution": "triangular", "min": 1, "mode": 7, "max": 6})"_json, &ctx), InputErrorException);
    EXPECT_THROW(makeSampleProvider(R"("fast")"_json, &ctx), InputErrorException);
    EXPECT_THROW(makeSampleProvider(R"([])"_json, &ctx), InputErrorException);
}
