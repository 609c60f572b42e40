#include <gtest/gtest.h>

#include "TestData.hpp"
#include "core/Exceptions.hpp"
#include "preprocessing/LabelEncoder.hpp"
#include "preprocessing/PowerTransformer.hpp"
#include "preprocessing/Preprocessor.hpp"

#include <cmath>
#include <numeric>

using namespace preprocessing;

TEST(LabelEncoderTest, CodesFollowSortedClasses) {
    LabelEncoder le;
    const auto codes = le.fitTransform({"udp", "tcp", "icmp", "tcp"});
    EXPECT_EQ(le.classes(), (std::vector<std::string>{"icmp", "tcp", "udp"}));
    EXPECT_EQ(codes, (std::vector<int>{2, 1, 0, 1}));
    EXPECT_THROW(le.transform({"sctp"}), ConfigurationError);
}

TEST(PowerTransformerTest, LambdaOneIsIdentityBeforeScaling) {
    for (double x : {-3.5, -1.0, 0.0, 0.25, 7.0}) {
        EXPECT_NEAR(PowerTransformer::yeoJohnson(x, 1.0), x, 1e-12);
    }
    EXPECT_NEAR(PowerTransformer::yeoJohnson(std::exp(1.0) - 1.0, 0.0), 1.0, 1e-12);
}

TEST(PowerTransformerTest, OutputIsStandardized) {
    std::vector<double> skewed;
    for (int i = 0; i < 200; ++i) skewed.push_back(std::pow(1.05, i));

    PowerTransformer pt;
    const auto out = pt.fitTransform(skewed);

    const double mean = std::accumulate(out.begin(), out.end(), 0.0) / out.size();
    double var = 0.0;
    for (double v : out) var += (v - mean) * (v - mean);
    var /= out.size();

    EXPECT_NEAR(mean, 0.0, 1e-9);
    EXPECT_NEAR(var, 1.0, 1e-9);
    EXPECT_LT(pt.lambda(), 1.0);
    EXPECT_GE(pt.lambda(), -5.0);
}

TEST(PowerTransformerTest, ConstantColumnBecomesZero) {
    PowerTransformer pt;
    const auto out = pt.fitTransform(std::vector<double>(10, 4.0));
    for (double v : out) EXPECT_DOUBLE_EQ(v, 0.0);
}

TEST(PreprocessorTest, SelectsColumnsInFeatureOrder) {
    Table features, targets;
    testdata::makeKddTables(60, 9, features, targets);
    const Table full = Table::concatColumns(features, targets);

    Preprocessor pre;
    const FeatureMatrix X = pre.encodeAndScale(full, features.headers());

    ASSERT_EQ(X.rowLength(), 31);
    EXPECT_EQ(X.rows(), 60u);
    EXPECT_EQ(X.columns[0], "duration");
    EXPECT_EQ(pre.categoricalIndices(X), (std::vector<int>{1, 2, 3}));
    for (const auto& name : X.columns) EXPECT_NE(name, "num_outbound_cmds");

    // Label-encoded columns hold small non-negative integers
    for (size_t r = 0; r < X.rows(); ++r) {
        EXPECT_GE(X.at(r, 1), 0.0);
        EXPECT_LT(X.at(r, 1), 3.0);
        EXPECT_EQ(X.at(r, 2), std::round(X.at(r, 2)));
    }
}

TEST(PreprocessorTest, MissingColumnIsConfigurationError) {
    Table t;
    t.addColumn("protocol_type", {"tcp"});
    Preprocessor pre;
    EXPECT_THROW(pre.encodeAndScale(t, t.headers()), ConfigurationError);
}

TEST(PreprocessorTest, UnparsableNumberIsIOError) {
    Table features, targets;
    testdata::makeKddTables(12, 9, features, targets);
    features.column("src_bytes")[4] = "12kb";
    Preprocessor pre;
    EXPECT_THROW(pre.encodeAndScale(features, features.headers()), IOError);
}

TEST(PreprocessorTest, EncodeLabelsKeepsColumnName) {
    Table features, targets;
    testdata::makeKddTables(12, 9, features, targets);
    const LabelVector y = Preprocessor::encodeLabels(targets, "target");
    EXPECT_EQ(y.name, "target");
    EXPECT_EQ(y.classes, (std::vector<std::string>{"attack", "normal"}));
    EXPECT_EQ(y.size(), 12u);
}
