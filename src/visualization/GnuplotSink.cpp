#include "visualization/GnuplotSink.hpp"
#include "visualization/ConfusionMatrix.hpp"
#include "core/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

std::string findExecutableInPath(const std::string& command) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

// Exit status of gnuplot, -1 when it could not be started
int spawnGnuplot(const std::string& executable, const std::string& scriptPath) {
    const char* argvRaw[] = {executable.c_str(), scriptPath.c_str(), nullptr};
    char* const* argv = const_cast<char* const*>(argvRaw);
    pid_t pid = -1;
    if (::posix_spawn(&pid, executable.c_str(), nullptr, nullptr, argv, environ) != 0 || pid <= 0) {
        return -1;
    }
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

GnuplotSink::GnuplotSink(std::string plotDir, bool renderImages)
    : plotDir_(std::move(plotDir)), renderImages_(renderImages) {
    std::error_code ec;
    std::filesystem::create_directories(plotDir_, ec);
    if (ec) {
        throw IOError("cannot create plot directory " + plotDir_ + ": " + ec.message());
    }
}

std::string GnuplotSink::sanitizeId(const std::string& title) {
    std::string out = title;
    std::replace_if(out.begin(), out.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-');
    }, '_');
    if (out.empty()) out = "plot";
    return out;
}

std::string GnuplotSink::quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') escaped += "''";
        else escaped.push_back(ch);
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotSink::header(const std::string& id, const std::string& title) const {
    std::ostringstream script;
    script << "set terminal pngcairo size 1000,800 enhanced\n";
    script << "set output " << quoteForGnuplot(plotDir_ + "/" + id + ".png") << "\n";
    script << "set title " << quoteForGnuplot(title) << " noenhanced font ',14'\n";
    script << "set tics out nomirror\n";
    return script.str();
}

void GnuplotSink::writeScript(const std::string& id, const std::string& data, const std::string& script) const {
    const std::string dataFile = plotDir_ + "/" + id + ".dat";
    const std::string scriptFile = plotDir_ + "/" + id + ".gp";

    std::ofstream dout(dataFile);
    dout << data;
    std::ofstream sout(scriptFile);
    sout << script;
    if (!dout.good() || !sout.good()) {
        throw IOError("cannot write plot files for " + id + " in " + plotDir_);
    }
    dout.close();
    sout.close();

    if (!renderImages_) return;

    static const std::string gnuplotExe = findExecutableInPath("gnuplot");
    if (gnuplotExe.empty()) {
        std::cerr << "Warning: gnuplot not found in PATH, skipped rendering " << id << std::endl;
        return;
    }
    const int rc = spawnGnuplot(gnuplotExe, scriptFile);
    if (rc != 0) {
        std::cerr << "Warning: gnuplot exited with status " << rc << " for " << scriptFile << std::endl;
    }
}

void GnuplotSink::confusionMatrix(const std::vector<int>& actual,
                                  const std::vector<int>& predicted,
                                  const std::vector<std::string>& classNames,
                                  const std::string& title) {
    const auto cm = ConfusionMatrix::compute(actual, predicted, classNames);

    std::cout << "\n" << title << "\n" << cm.toString();

    const size_t K = classNames.size();
    std::ostringstream data;
    for (size_t r = 0; r < K; ++r) {
        for (size_t c = 0; c < K; ++c) {
            data << c << " " << r << " " << cm.counts[r][c] << "\n";
        }
        data << "\n";
    }

    const std::string id = sanitizeId(title);
    std::ostringstream script;
    script << header(id, title);
    script << "set view map\nunset key\n";
    script << "set palette defined (0 '#f7fbff', 1 '#08306b')\n";
    script << "set xlabel 'Predicted label'\nset ylabel 'True label'\n";
    script << "set yrange [" << K << "-0.5:-0.5]\n";
    script << "set xrange [-0.5:" << K << "-0.5]\n";
    for (const char* axis : {"xtics", "ytics"}) {
        script << "set " << axis << " (";
        for (size_t i = 0; i < K; ++i) {
            if (i > 0) script << ", ";
            script << quoteForGnuplot(classNames[i]) << " " << i;
        }
        script << ")" << (axis[0] == 'x' ? " rotate by -35" : "") << "\n";
    }
    const std::string dat = quoteForGnuplot(plotDir_ + "/" + id + ".dat");
    script << "plot " << dat << " using 1:2:3 with image, "
           << dat << " using 1:2:(sprintf('%d', $3)) with labels\n";

    writeScript(id, data.str(), script.str());
}

void GnuplotSink::barChart(const std::vector<std::string>& labels,
                           const std::vector<double>& values,
                           const std::string& title) {
    if (labels.size() != values.size()) {
        throw ConfigurationError("bar chart needs one value per label");
    }

    std::cout << "\n" << title << "\n";
    size_t width = 8;
    for (const auto& label : labels) width = std::max(width, label.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << labels[i]
                  << std::right << " " << values[i] << "\n";
    }

    std::ostringstream data;
    for (size_t i = 0; i < labels.size(); ++i) {
        data << i << " \"" << labels[i] << "\" " << values[i] << "\n";
    }

    const std::string id = sanitizeId(title);
    std::ostringstream script;
    script << header(id, title);
    script << "unset key\nset style fill solid 0.8 border -1\nset boxwidth 0.7\n";
    script << "set xtics rotate by -35\nset yrange [0:*]\n";
    script << "plot " << quoteForGnuplot(plotDir_ + "/" + id + ".dat")
           << " using 1:3:xtic(2) with boxes lc rgb '#2563eb'\n";

    writeScript(id, data.str(), script.str());
}
