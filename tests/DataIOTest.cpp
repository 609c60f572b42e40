#include <gtest/gtest.h>

#include "TestData.hpp"
#include "core/Exceptions.hpp"
#include "dataset/KDDCup1999.hpp"
#include "functions/io/DataIO.hpp"

#include <filesystem>
#include <fstream>

namespace {

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST(DataIOTest, ReadsTrimmedCellsAndSkipsBlankLines) {
    const std::string dir = testdata::scratchDir("io");
    writeFile(dir + "/small.csv", "a, b ,c\n1, x ,2.5\n\n3,y,4\n");

    DataIO io;
    const Table t = io.readTable(dir, "small");
    ASSERT_EQ(t.rows(), 2u);
    ASSERT_EQ(t.cols(), 3u);
    EXPECT_EQ(t.headers()[1], "b");
    EXPECT_EQ(t.column("b")[0], "x");
    EXPECT_EQ(t.column("c")[1], "4");
}

TEST(DataIOTest, MissingEmptyAndRaggedFilesAreIOErrors) {
    const std::string dir = testdata::scratchDir("io");
    writeFile(dir + "/empty.csv", "");
    writeFile(dir + "/ragged.csv", "a,b\n1,2\n3\n");

    DataIO io;
    EXPECT_THROW(io.readTable(dir, "absent"), IOError);
    EXPECT_THROW(io.readTable(dir, "empty"), IOError);
    EXPECT_THROW(io.readTable(dir, "ragged"), IOError);
}

TEST(DataIOTest, TablePathJoinsDirectoryAndStem) {
    EXPECT_EQ(DataIO::tablePath("data", "kddcup_target"), "data/kddcup_target.csv");
    EXPECT_EQ(DataIO::tablePath("data/", "kddcup"), "data/kddcup.csv");
}

TEST(DataIOTest, WriteCSVRoundsTripThroughReader) {
    const std::string dir = testdata::scratchDir("io");
    DataIO io;
    io.writeCSV(dir + "/scores.csv", {"strategy", "label"}, {{"SMOTE", "target"}, {"Original", "attack_category"}});

    const Table t = io.readCSV(dir + "/scores.csv");
    ASSERT_EQ(t.rows(), 2u);
    EXPECT_EQ(t.column("strategy")[1], "Original");
    EXPECT_THROW(io.writeCSV(dir + "/no/such/dir/x.csv", {"a"}, {}), IOError);
}

TEST(KDDCup1999Test, LoadsAndJoinsFeatureAndTargetTables) {
    const std::string dir = testdata::scratchDir("kdd");
    Table features, targets;
    testdata::makeKddTables(24, 3, features, targets);
    testdata::writeTable(features, dir + "/mini_processed.csv");
    testdata::writeTable(targets, dir + "/mini_target.csv");

    KDDCup1999 ds(DatasetConfig{dir, "mini"});
    ds.load(DataIO());

    EXPECT_EQ(ds.full().rows(), 24u);
    EXPECT_EQ(ds.full().cols(), features.cols() + 2);

    const auto byCategory = ds.rowCountByTarget("attack_category");
    ASSERT_EQ(byCategory.size(), 4u);
    EXPECT_EQ(byCategory.front().first, "normal");
    EXPECT_EQ(byCategory.front().second, 12u);

    const auto counts = ds.attackCategoryCount();
    EXPECT_EQ(counts.at("r2l"), 2u);
    EXPECT_EQ(counts.at("dos"), 6u);
}

TEST(KDDCup1999Test, MismatchedRowCountsFailAtLoad) {
    const std::string dir = testdata::scratchDir("kdd");
    Table features, targets, fewer;
    testdata::makeKddTables(24, 3, features, targets);
    testdata::makeKddTables(12, 3, fewer, targets);
    testdata::writeTable(features, dir + "/mini_processed.csv");
    testdata::writeTable(targets, dir + "/mini_target.csv");

    KDDCup1999 ds(DatasetConfig{dir, "mini"});
    EXPECT_THROW(ds.load(DataIO()), IOError);
}
