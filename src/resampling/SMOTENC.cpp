#include "resampling/SMOTENC.hpp"
#include "resampling/NearestNeighbors.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

SMOTENC::SMOTENC(std::vector<int> categoricalFeatures, uint32_t seed, int kNeighbors)
    : OverSampler(seed), categoricalFeatures_(std::move(categoricalFeatures)), kNeighbors_(kNeighbors) {
    if (categoricalFeatures_.empty()) {
        throw ConfigurationError("SMOTENC needs at least one categorical feature; use SMOTE instead");
    }
}

void SMOTENC::validateCategorical(const FeatureMatrix& X) const {
    const int d = X.rowLength();
    std::set<int> seen;
    for (int c : categoricalFeatures_) {
        if (c < 0 || c >= d) {
            throw ConfigurationError("SMOTENC categorical index " + std::to_string(c) +
                                     " out of range for " + std::to_string(d) + " columns");
        }
        if (!seen.insert(c).second) {
            throw ConfigurationError("SMOTENC categorical index " + std::to_string(c) + " repeated");
        }
    }
    if (static_cast<int>(seen.size()) >= d) {
        throw ConfigurationError("SMOTENC needs at least one continuous column");
    }

    const size_t n = X.rows();
    for (int c : categoricalFeatures_) {
        for (size_t i = 0; i < n; ++i) {
            const double v = X.at(i, c);
            if (std::abs(v - std::round(v)) > 1e-9) {
                throw ConfigurationError("SMOTENC column " + std::to_string(c) + " ('" + X.columns[c] +
                                         "') is not categorical: value " + std::to_string(v));
            }
        }
    }
}

double SMOTENC::medianStd(const FeatureMatrix& X, const std::vector<size_t>& rows) const {
    std::vector<double> stds;
    const double n = static_cast<double>(rows.size());
    for (int c = 0; c < X.rowLength(); ++c) {
        if (std::find(categoricalFeatures_.begin(), categoricalFeatures_.end(), c) != categoricalFeatures_.end()) {
            continue;
        }
        double mean = 0.0;
        for (size_t r : rows) mean += X.at(r, c);
        mean /= n;
        double var = 0.0;
        for (size_t r : rows) var += (X.at(r, c) - mean) * (X.at(r, c) - mean);
        stds.push_back(std::sqrt(var / n));
    }
    std::sort(stds.begin(), stds.end());
    const size_t m = stds.size();
    return (m % 2 == 1) ? stds[m / 2] : 0.5 * (stds[m / 2 - 1] + stds[m / 2]);
}

ResampleResult SMOTENC::fitResample(const FeatureMatrix& X, const LabelVector& y) const {
    validateCategorical(X);

    // Categorical mismatch penalty comes from the smallest class
    const auto counts = y.classCounts();
    int smallest = -1;
    for (int c = 0; c < static_cast<int>(counts.size()); ++c) {
        if (counts[c] == 0) continue;
        if (smallest < 0 || counts[c] < counts[smallest]) smallest = c;
    }
    double penalty = 0.0;
    if (smallest >= 0) {
        const double m = medianStd(X, classRows(y, smallest));
        penalty = m * m / 2.0;
    }

    return oversample(X, y, [&](int cls, size_t nSamples, std::mt19937& gen, FeatureMatrix& out) {
        const auto rows = classRows(y, cls);
        requireClassSize(y, cls, rows.size(), kNeighbors_ + 1, name());

        NearestNeighbors nn(kNeighbors_);
        nn.setCategorical(categoricalFeatures_, X.rowLength(), penalty);
        nn.fit(X, rows);
        const auto neighbors = nn.kneighbors(rows);

        auto voteCategories = [&](size_t seedPos, double* row) {
            for (int c : categoricalFeatures_) {
                std::map<double, int> votes;
                for (size_t pos : neighbors[seedPos]) ++votes[X.at(rows[pos], c)];
                // Highest count wins, smallest value on ties
                double best = votes.begin()->first;
                int bestCount = 0;
                for (const auto& [value, count] : votes) {
                    if (count > bestCount) {
                        best = value;
                        bestCount = count;
                    }
                }
                row[c] = best;
            }
        };

        makeSamples(X, rows, rows, neighbors, nSamples, 1.0, gen, out, voteCategories);
    });
}
