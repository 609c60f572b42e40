// =============================================================================
// include/core/Types.hpp - Feature matrix and label vector shared by all stages
// =============================================================================
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * Row-major numeric feature matrix with named columns.
 * values.size() is always rows() * rowLength().
 */
struct FeatureMatrix {
    std::vector<std::string> columns;
    std::vector<double> values;

    FeatureMatrix() = default;
    FeatureMatrix(std::vector<std::string> cols, std::vector<double> vals)
        : columns(std::move(cols)), values(std::move(vals)) {}

    int rowLength() const { return static_cast<int>(columns.size()); }

    size_t rows() const {
        return columns.empty() ? 0 : values.size() / columns.size();
    }

    const double* row(size_t i) const { return &values[i * columns.size()]; }

    double at(size_t r, size_t c) const { return values[r * columns.size() + c]; }

    void appendRow(const double* src) {
        values.insert(values.end(), src, src + columns.size());
    }

    // Same schema, no rows
    FeatureMatrix emptyLike() const { return FeatureMatrix(columns, {}); }

    bool operator==(const FeatureMatrix& other) const {
        return columns == other.columns && values == other.values;
    }
};

/**
 * Categorical label column. codes[i] indexes into classes.
 */
struct LabelVector {
    std::string name;
    std::vector<int> codes;
    std::vector<std::string> classes;

    size_t size() const { return codes.size(); }
    int numClasses() const { return static_cast<int>(classes.size()); }

    // Per-class row counts, indexed by class code
    std::vector<size_t> classCounts() const;

    // (class name, count) ordered by descending count, ties by class code
    std::vector<std::pair<std::string, size_t>> valueCounts() const;

    LabelVector emptyLike() const { return LabelVector{name, {}, classes}; }

    bool operator==(const LabelVector& other) const {
        return name == other.name && codes == other.codes && classes == other.classes;
    }
};

// max class count / min class count over classes that are present
double imbalanceRatio(const LabelVector& labels);
