#include "preprocessing/Preprocessor.hpp"
#include "preprocessing/LabelEncoder.hpp"
#include "preprocessing/PowerTransformer.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace preprocessing {

std::vector<std::string> PreprocessorConfig::defaultScaleColumns() {
    return {"duration", "src_bytes", "dst_bytes", "land", "wrong_fragment", "urgent", "hot",
            "num_failed_logins", "logged_in", "num_compromised", "root_shell", "su_attempted",
            "num_root", "num_file_creations", "num_shells", "num_access_files", "is_guest_login",
            "count", "srv_count", "serror_rate", "rerror_rate", "diff_srv_rate", "srv_diff_host_rate",
            "dst_host_count", "dst_host_srv_count", "dst_host_diff_srv_rate",
            "dst_host_same_src_port_rate", "dst_host_srv_diff_host_rate"};
}

Preprocessor::Preprocessor(PreprocessorConfig config) : config_(std::move(config)) {}

bool Preprocessor::isCategorical(const std::string& name) const {
    return std::find(config_.categoricalColumns.begin(), config_.categoricalColumns.end(), name)
           != config_.categoricalColumns.end();
}

bool Preprocessor::isScaled(const std::string& name) const {
    return std::find(config_.scaleColumns.begin(), config_.scaleColumns.end(), name)
           != config_.scaleColumns.end();
}

FeatureMatrix Preprocessor::encodeAndScale(const Table& full,
                                           const std::vector<std::string>& featureOrder) const {
    for (const auto& name : config_.categoricalColumns) {
        if (!full.hasColumn(name)) throw ConfigurationError("categorical column '" + name + "' missing");
    }
    for (const auto& name : config_.scaleColumns) {
        if (!full.hasColumn(name)) throw ConfigurationError("numeric column '" + name + "' missing");
    }

    std::vector<std::string> selected;
    for (const auto& name : featureOrder) {
        if (isCategorical(name) || isScaled(name)) selected.push_back(name);
    }
    if (selected.empty()) {
        throw ConfigurationError("no feature columns selected");
    }

    const size_t n = full.rows();
    const int cols = static_cast<int>(selected.size());
    std::vector<std::vector<double>> encoded(cols);

    // Parse serially so parse errors surface deterministically
    for (int c = 0; c < cols; ++c) {
        const auto& raw = full.column(selected[c]);
        if (isCategorical(selected[c])) {
            LabelEncoder le;
            const auto codes = le.fitTransform(raw);
            encoded[c].assign(codes.begin(), codes.end());
            continue;
        }
        encoded[c].resize(n);
        for (size_t i = 0; i < n; ++i) {
            try {
                size_t used = 0;
                encoded[c][i] = std::stod(raw[i], &used);
                if (used != raw[i].size()) throw std::invalid_argument(raw[i]);
            } catch (const std::exception&) {
                throw IOError("column '" + selected[c] + "' row " + std::to_string(i) +
                              ": cannot parse '" + raw[i] + "' as a number");
            }
        }
    }

    #pragma omp parallel for schedule(dynamic) if(cols > 4 && n > 1000)
    for (int c = 0; c < cols; ++c) {
        if (isCategorical(selected[c])) continue;
        PowerTransformer pt(config_.standardize);
        encoded[c] = pt.fitTransform(encoded[c]);
    }

    FeatureMatrix X;
    X.columns = selected;
    X.values.resize(n * cols);
    for (size_t i = 0; i < n; ++i) {
        for (int c = 0; c < cols; ++c) {
            X.values[i * cols + c] = encoded[c][i];
        }
    }

    const size_t numCategorical = categoricalIndices(X).size();
    std::cout << "Feature matrix: " << n << " rows x " << cols << " columns ("
              << numCategorical << " label-encoded, "
              << (cols - numCategorical) << " power-transformed)" << std::endl;
    return X;
}

std::vector<int> Preprocessor::categoricalIndices(const FeatureMatrix& X) const {
    std::vector<int> indices;
    for (int c = 0; c < X.rowLength(); ++c) {
        if (isCategorical(X.columns[c])) indices.push_back(c);
    }
    return indices;
}

LabelVector Preprocessor::encodeLabels(const Table& full, const std::string& column) {
    LabelEncoder le;
    LabelVector labels;
    labels.name = column;
    labels.codes = le.fitTransform(full.column(column));
    labels.classes = le.classes();
    return labels;
}

} // namespace preprocessing
