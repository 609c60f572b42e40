#include <gtest/gtest.h>

#include "core/Exceptions.hpp"
#include "core/Table.hpp"
#include "core/Types.hpp"

TEST(LabelVectorTest, ClassCountsFollowCodes) {
    LabelVector y{"attack_category", {0, 2, 2, 1, 2, 0}, {"dos", "normal", "probe"}};
    const auto counts = y.classCounts();
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts[0], 2u);
    EXPECT_EQ(counts[1], 1u);
    EXPECT_EQ(counts[2], 3u);
}

TEST(LabelVectorTest, ValueCountsLargestFirstTiesByCode) {
    LabelVector y{"target", {1, 0, 2, 1, 0}, {"a", "b", "c"}};
    const auto vc = y.valueCounts();
    ASSERT_EQ(vc.size(), 3u);
    EXPECT_EQ(vc[0].first, "a");
    EXPECT_EQ(vc[1].first, "b");
    EXPECT_EQ(vc[2].first, "c");
    EXPECT_EQ(vc[2].second, 1u);
}

TEST(LabelVectorTest, ImbalanceRatioIgnoresEmptyClasses) {
    LabelVector y{"target", {0, 0, 0, 0, 2}, {"a", "b", "c"}};
    EXPECT_DOUBLE_EQ(imbalanceRatio(y), 4.0);
}

TEST(FeatureMatrixTest, RowAccessIsRowMajor) {
    FeatureMatrix X({"a", "b"}, {1, 2, 3, 4, 5, 6});
    EXPECT_EQ(X.rows(), 3u);
    EXPECT_EQ(X.rowLength(), 2);
    EXPECT_DOUBLE_EQ(X.at(1, 0), 3.0);
    EXPECT_DOUBLE_EQ(X.row(2)[1], 6.0);

    FeatureMatrix copy = X.emptyLike();
    copy.appendRow(X.row(1));
    EXPECT_EQ(copy.rows(), 1u);
    EXPECT_DOUBLE_EQ(copy.at(0, 1), 4.0);
}

TEST(TableTest, ConcatColumnsRequiresEqualRows) {
    Table left, right, shortTable;
    left.addColumn("a", {"1", "2"});
    right.addColumn("b", {"x", "y"});
    shortTable.addColumn("c", {"only"});

    const Table full = Table::concatColumns(left, right);
    EXPECT_EQ(full.cols(), 2u);
    EXPECT_EQ(full.column("b")[1], "y");

    EXPECT_THROW(Table::concatColumns(left, shortTable), IOError);
    EXPECT_THROW(full.column("missing"), ConfigurationError);
    EXPECT_THROW(left.addColumn("a", {"3", "4"}), IOError);
}

TEST(ExceptionsTest, MessagesCarryCategoryPrefix) {
    try {
        throw KeyConflictError("(Original, target) is already recorded");
    } catch (const SamplingException& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Key Conflict: ", 0), 0u);
    }
}
