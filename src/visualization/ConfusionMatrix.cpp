#include "visualization/ConfusionMatrix.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

ConfusionMatrix ConfusionMatrix::compute(const std::vector<int>& actual,
                                         const std::vector<int>& predicted,
                                         const std::vector<std::string>& classNames) {
    if (actual.size() != predicted.size()) {
        throw ConfigurationError("confusion matrix needs equal lengths, got " +
                                 std::to_string(actual.size()) + " actual and " +
                                 std::to_string(predicted.size()) + " predicted");
    }

    const int K = static_cast<int>(classNames.size());
    ConfusionMatrix cm;
    cm.classNames = classNames;
    cm.counts.assign(K, std::vector<size_t>(K, 0));

    for (size_t i = 0; i < actual.size(); ++i) {
        const int a = actual[i];
        const int p = predicted[i];
        if (a < 0 || a >= K || p < 0 || p >= K) {
            throw ConfigurationError("label code out of range at row " + std::to_string(i));
        }
        ++cm.counts[a][p];
    }
    return cm;
}

size_t ConfusionMatrix::total() const {
    size_t sum = 0;
    for (const auto& row : counts) {
        for (size_t c : row) sum += c;
    }
    return sum;
}

double ConfusionMatrix::accuracy() const {
    const size_t n = total();
    if (n == 0) return 0.0;
    size_t diag = 0;
    for (size_t k = 0; k < counts.size(); ++k) diag += counts[k][k];
    return static_cast<double>(diag) / n;
}

std::string ConfusionMatrix::toString() const {
    size_t width = 6;
    for (const auto& name : classNames) width = std::max(width, name.size());
    for (const auto& row : counts) {
        for (size_t c : row) width = std::max(width, std::to_string(c).size());
    }
    width += 1;

    std::ostringstream out;
    out << std::setw(static_cast<int>(width)) << "actual";
    for (const auto& name : classNames) out << std::setw(static_cast<int>(width)) << name;
    out << "\n";
    for (size_t r = 0; r < counts.size(); ++r) {
        out << std::setw(static_cast<int>(width)) << classNames[r];
        for (size_t c : counts[r]) out << std::setw(static_cast<int>(width)) << c;
        out << "\n";
    }
    return out.str();
}
