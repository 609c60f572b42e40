#include "core/RunLog.hpp"
#include "core/Exceptions.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

std::string runTimestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream os;
    os << std::put_time(&local, "%Y%m%d-%H%M%S");
    return os.str();
}

bool isDebuggerAttached() {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("TracerPid:", 0) == 0) {
            std::istringstream is(line.substr(10));
            int pid = 0;
            is >> pid;
            return pid != 0;
        }
    }
    return false;
}

LogRedirect::LogRedirect(const std::string& logDir,
                         const std::string& prefix,
                         const std::string& timestamp,
                         bool enabled) {
    if (!enabled || isDebuggerAttached()) {
        return;
    }

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
        throw IOError("cannot create log directory " + logDir + ": " + ec.message());
    }

    path_ = (fs::path(logDir) / (prefix + "_" + timestamp + "_stdout.txt")).string();
    file_.open(path_);
    if (!file_.is_open()) {
        throw IOError("Unable to open log file: " + path_);
    }

    std::cout.flush();
    original_ = std::cout.rdbuf(file_.rdbuf());
}

LogRedirect::~LogRedirect() {
    if (original_) {
        std::cout.flush();
        std::cout.rdbuf(original_);
        original_ = nullptr;
        file_.close();
    }
}

ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_);
    std::ostringstream os;
    os << title_ << " - done in " << std::fixed << std::setprecision(0)
       << elapsed.count() << "s";
    std::cout << os.str() << std::endl;
}
