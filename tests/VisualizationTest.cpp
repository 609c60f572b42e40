#include <gtest/gtest.h>

#include "TestData.hpp"
#include "core/Exceptions.hpp"
#include "visualization/ConfusionMatrix.hpp"
#include "visualization/GnuplotSink.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string readAll(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(ConfusionMatrixTest, CountsActualAgainstPredicted) {
    const auto cm = ConfusionMatrix::compute({0, 0, 1, 1, 2, 2, 2}, {0, 1, 1, 1, 2, 0, 2},
                                             {"dos", "normal", "probe"});
    ASSERT_EQ(cm.counts.size(), 3u);
    EXPECT_EQ(cm.counts[0], (std::vector<size_t>{1, 1, 0}));
    EXPECT_EQ(cm.counts[1], (std::vector<size_t>{0, 2, 0}));
    EXPECT_EQ(cm.counts[2], (std::vector<size_t>{1, 0, 2}));
    EXPECT_EQ(cm.total(), 7u);
    EXPECT_DOUBLE_EQ(cm.accuracy(), 5.0 / 7.0);
}

TEST(ConfusionMatrixTest, TextTableHasOneLinePerClass) {
    const auto cm = ConfusionMatrix::compute({0, 1}, {0, 0}, {"attack", "normal"});
    const std::string text = cm.toString();
    EXPECT_NE(text.find("actual"), std::string::npos);
    EXPECT_NE(text.find("attack"), std::string::npos);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 3);
}

TEST(ConfusionMatrixTest, EmptyInputHasZeroAccuracy) {
    const auto cm = ConfusionMatrix::compute({}, {}, {"a", "b"});
    EXPECT_EQ(cm.total(), 0u);
    EXPECT_EQ(cm.accuracy(), 0.0);
}

TEST(ConfusionMatrixTest, RejectsMismatchedOrOutOfRangeCodes) {
    EXPECT_THROW(ConfusionMatrix::compute({0, 1}, {0}, {"a", "b"}), ConfigurationError);
    EXPECT_THROW(ConfusionMatrix::compute({0, 2}, {0, 1}, {"a", "b"}), ConfigurationError);
    EXPECT_THROW(ConfusionMatrix::compute({0, 1}, {-1, 1}, {"a", "b"}), ConfigurationError);
}

TEST(GnuplotSinkTest, SanitizeIdKeepsOnlySafeCharacters) {
    EXPECT_EQ(GnuplotSink::sanitizeId("SMOTE - XGBClassifier - Label target"),
              "SMOTE_-_XGBClassifier_-_Label_target");
    EXPECT_EQ(GnuplotSink::sanitizeId("Re-weighted Count (attack_category)"),
              "Re-weighted_Count__attack_category_");
    EXPECT_EQ(GnuplotSink::sanitizeId(""), "plot");
}

TEST(GnuplotSinkTest, QuoteDoublesSingleQuotes) {
    EXPECT_EQ(GnuplotSink::quoteForGnuplot("plain"), "'plain'");
    EXPECT_EQ(GnuplotSink::quoteForGnuplot("it's"), "'it''s'");
}

TEST(GnuplotSinkTest, ConfusionMatrixWritesDataAndScript) {
    const std::string dir = testdata::scratchDir("plots");
    GnuplotSink sink(dir, false);
    sink.confusionMatrix({0, 1, 1}, {0, 1, 0}, {"attack", "normal"}, "Original - XGBClassifier - Label target");

    const fs::path dat = fs::path(dir) / "Original_-_XGBClassifier_-_Label_target.dat";
    const fs::path gp = fs::path(dir) / "Original_-_XGBClassifier_-_Label_target.gp";
    ASSERT_TRUE(fs::exists(dat));
    ASSERT_TRUE(fs::exists(gp));
    EXPECT_FALSE(fs::exists(fs::path(dir) / "Original_-_XGBClassifier_-_Label_target.png"));

    EXPECT_EQ(readAll(dat), "0 0 1\n1 0 0\n\n0 1 1\n1 1 1\n\n");
    const std::string script = readAll(gp);
    EXPECT_NE(script.find("with image"), std::string::npos);
    EXPECT_NE(script.find("'attack' 0, 'normal' 1"), std::string::npos);
}

TEST(GnuplotSinkTest, BarChartWritesOneLinePerBar) {
    const std::string dir = testdata::scratchDir("plots");
    GnuplotSink sink(dir, false);
    sink.barChart({"normal", "dos"}, {60.0, 24.0}, "Re-weighted Count (attack_category) - Original");

    const fs::path dat = fs::path(dir) / "Re-weighted_Count__attack_category__-_Original.dat";
    ASSERT_TRUE(fs::exists(dat));
    EXPECT_EQ(readAll(dat), "0 \"normal\" 60\n1 \"dos\" 24\n");
    EXPECT_THROW(sink.barChart({"a"}, {1.0, 2.0}, "bad"), ConfigurationError);
}

TEST(GnuplotSinkTest, PlotDirectoryThatIsAFileIsIOError) {
    const std::string blocker = testdata::scratchDir("plots") + "/file";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(GnuplotSink(blocker + "/sub", false), IOError);
}
