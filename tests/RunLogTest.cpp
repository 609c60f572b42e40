#include <gtest/gtest.h>

#include "TestData.hpp"
#include "core/Exceptions.hpp"
#include "core/RunLog.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Swaps std::cout for a string buffer inside one test
class CoutCapture {
public:
    CoutCapture() : original_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(original_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* original_;
};

} // namespace

TEST(RunLogTest, TimestampHasDateAndTime) {
    const std::string ts = runTimestamp();
    ASSERT_EQ(ts.size(), 15u);
    EXPECT_EQ(ts[8], '-');
    for (size_t i = 0; i < ts.size(); ++i) {
        if (i != 8) EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(ts[i]))) << ts;
    }
}

TEST(RunLogTest, RedirectWritesFileAndRestoresStdout) {
    if (isDebuggerAttached()) GTEST_SKIP() << "stdout is not redirected under a debugger";

    const std::string dir = testdata::scratchDir("logs") + "/nested";
    std::streambuf* before = std::cout.rdbuf();
    std::string path;
    {
        LogRedirect redirect(dir, "Sampling", "20240101-000000");
        ASSERT_TRUE(redirect.active());
        path = redirect.path();
        EXPECT_NE(std::cout.rdbuf(), before);
        std::cout << "captured line" << std::endl;
    }
    EXPECT_EQ(std::cout.rdbuf(), before);
    EXPECT_EQ(fs::path(path).filename().string(), "Sampling_20240101-000000_stdout.txt");
    EXPECT_EQ(readAll(path), "captured line\n");
}

TEST(RunLogTest, RedirectIsReleasedWhenRunThrows) {
    if (isDebuggerAttached()) GTEST_SKIP() << "stdout is not redirected under a debugger";

    const std::string dir = testdata::scratchDir("logs");
    std::streambuf* before = std::cout.rdbuf();
    EXPECT_THROW({
        LogRedirect redirect(dir, "Sampling", "20240101-000001");
        std::cout << "before failure" << std::endl;
        throw InsufficientSamplesError("strategy failed");
    }, InsufficientSamplesError);
    EXPECT_EQ(std::cout.rdbuf(), before);
    EXPECT_EQ(readAll(dir + "/Sampling_20240101-000001_stdout.txt"), "before failure\n");
}

TEST(RunLogTest, DisabledRedirectLeavesStdoutAlone) {
    const std::string dir = testdata::scratchDir("logs") + "/unused";
    std::streambuf* before = std::cout.rdbuf();
    {
        LogRedirect redirect(dir, "Sampling", "20240101-000002", false);
        EXPECT_FALSE(redirect.active());
        EXPECT_TRUE(redirect.path().empty());
        EXPECT_EQ(std::cout.rdbuf(), before);
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST(RunLogTest, UnwritableLogDirectoryIsIOError) {
    if (isDebuggerAttached()) GTEST_SKIP() << "stdout is not redirected under a debugger";

    const std::string blocker = testdata::scratchDir("logs") + "/file";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(LogRedirect(blocker + "/sub", "Sampling", "20240101-000003"), IOError);
}

TEST(RunLogTest, ScopedTimerReportsOnExit) {
    CoutCapture capture;
    {
        ScopedTimer timer("\nLoading dataset");
        EXPECT_EQ(capture.str(), "");
    }
    EXPECT_EQ(capture.str(), "\nLoading dataset - done in 0s\n");
}
