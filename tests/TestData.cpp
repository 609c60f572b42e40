#include "TestData.hpp"
#include "preprocessing/Preprocessor.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <random>

namespace testdata {

void makeBlobs(const std::vector<size_t>& counts,
               const std::vector<std::string>& classNames,
               int features,
               double separation,
               uint32_t seed,
               FeatureMatrix& X,
               LabelVector& y) {
    X.columns.clear();
    X.values.clear();
    for (int f = 0; f < features; ++f) X.columns.push_back("f" + std::to_string(f));

    y.name = "label";
    y.classes = classNames;
    y.codes.clear();

    std::mt19937 gen(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    for (size_t c = 0; c < counts.size(); ++c) {
        for (size_t i = 0; i < counts[c]; ++i) {
            for (int f = 0; f < features; ++f) {
                X.values.push_back(separation * static_cast<double>(c) + noise(gen));
            }
            y.codes.push_back(static_cast<int>(c));
        }
    }
}

void makeLine(size_t majority, size_t minority, FeatureMatrix& X, LabelVector& y) {
    X.columns = {"x", "kind"};
    X.values.clear();
    y.name = "label";
    y.classes = {"major", "minor"};
    y.codes.clear();

    for (size_t i = 0; i < majority; ++i) {
        X.values.push_back(10.0 * static_cast<double>(i));
        X.values.push_back(0.0);
        y.codes.push_back(0);
    }
    for (size_t i = 0; i < minority; ++i) {
        X.values.push_back(10.0 * static_cast<double>(majority + i));
        X.values.push_back(static_cast<double>(1 + i % 2));
        y.codes.push_back(1);
    }
}

std::string scratchDir(const std::string& tag) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = tag;
    if (info) name += std::string("_") + info->test_suite_name() + "_" + info->name();
    const auto dir = std::filesystem::temp_directory_path() / ("sampling_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

void makeKddTables(size_t n, uint32_t seed, Table& features, Table& targets) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::exponential_distribution<double> skewed(0.01);

    const char* protocols[] = {"tcp", "udp", "icmp"};
    const char* services[] = {"http", "smtp", "ftp", "private"};
    const char* flags[] = {"SF", "S0", "REJ"};
    const char* categories[] = {"normal", "normal", "normal", "normal", "normal", "normal",
                                "dos", "dos", "dos", "probe", "probe", "r2l"};

    const auto scaleColumns = preprocessing::PreprocessorConfig::defaultScaleColumns();

    std::vector<std::string> protocol, service, flag, unused, category, target;
    std::vector<std::vector<std::string>> numeric(scaleColumns.size());

    for (size_t i = 0; i < n; ++i) {
        protocol.push_back(protocols[gen() % 3]);
        service.push_back(services[gen() % 4]);
        flag.push_back(flags[gen() % 3]);
        unused.push_back("0");
        for (size_t c = 0; c < scaleColumns.size(); ++c) {
            const double v = (c % 2 == 0) ? std::floor(skewed(gen)) : unit(gen);
            numeric[c].push_back(std::to_string(v));
        }
        const std::string cat = categories[i % 12];
        category.push_back(cat);
        target.push_back(cat == "normal" ? "normal" : "attack");
    }

    features = Table();
    features.addColumn("duration", numeric[0]);
    features.addColumn("protocol_type", protocol);
    features.addColumn("service", service);
    features.addColumn("flag", flag);
    for (size_t c = 1; c < scaleColumns.size(); ++c) {
        features.addColumn(scaleColumns[c], numeric[c]);
        if (scaleColumns[c] == "num_access_files") features.addColumn("num_outbound_cmds", unused);
    }

    targets = Table();
    targets.addColumn("attack_category", category);
    targets.addColumn("target", target);
}

void writeTable(const Table& table, const std::string& path) {
    std::ofstream out(path);
    const auto& headers = table.headers();
    for (size_t c = 0; c < headers.size(); ++c) {
        out << headers[c] << (c + 1 < headers.size() ? "," : "\n");
    }
    for (size_t r = 0; r < table.rows(); ++r) {
        for (size_t c = 0; c < headers.size(); ++c) {
            out << table.column(headers[c])[r] << (c + 1 < headers.size() ? "," : "\n");
        }
    }
}

} // namespace testdata
