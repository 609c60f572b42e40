#include "resampling/OverSampler.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>

ResampleResult OverSampler::oversample(const FeatureMatrix& X,
                                       const LabelVector& y,
                                       const ClassSampler& sampleClass) const {
    if (X.rows() != y.size()) {
        throw ConfigurationError("feature rows (" + std::to_string(X.rows()) +
                                 ") and labels (" + std::to_string(y.size()) + ") differ");
    }

    const auto counts = y.classCounts();
    const size_t present = std::count_if(counts.begin(), counts.end(),
                                         [](size_t c) { return c > 0; });
    if (present < 2) {
        throw ConfigurationError(name() + " needs at least two classes in '" + y.name + "'");
    }
    const size_t majority = *std::max_element(counts.begin(), counts.end());

    ResampleResult result{X, y};
    std::mt19937 gen(seed_);

    for (int cls = 0; cls < static_cast<int>(counts.size()); ++cls) {
        if (counts[cls] == 0 || counts[cls] >= majority) continue;
        const size_t need = majority - counts[cls];

        FeatureMatrix synthetic = X.emptyLike();
        synthetic.values.reserve(need * X.columns.size());
        sampleClass(cls, need, gen, synthetic);

        result.X.values.insert(result.X.values.end(),
                               synthetic.values.begin(), synthetic.values.end());
        result.y.codes.insert(result.y.codes.end(), synthetic.rows(), cls);
    }

    return result;
}

std::vector<size_t> OverSampler::classRows(const LabelVector& y, int cls) {
    std::vector<size_t> rows;
    for (size_t i = 0; i < y.codes.size(); ++i) {
        if (y.codes[i] == cls) rows.push_back(i);
    }
    return rows;
}

void OverSampler::makeSamples(const FeatureMatrix& X,
                              const std::vector<size_t>& seedRows,
                              const std::vector<size_t>& poolRows,
                              const std::vector<std::vector<size_t>>& neighbors,
                              size_t nSamples,
                              double stepSize,
                              std::mt19937& gen,
                              FeatureMatrix& out,
                              const std::function<void(size_t, double*)>& finish) {
    if (nSamples == 0 || seedRows.empty()) return;

    const size_t k = neighbors.front().size();
    const int d = X.rowLength();
    std::uniform_int_distribution<size_t> pick(0, seedRows.size() * k - 1);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    std::vector<double> row(d);
    for (size_t s = 0; s < nSamples; ++s) {
        const size_t idx = pick(gen);
        const size_t seedPos = idx / k;
        const size_t nnPos = idx % k;
        const double gap = stepSize * unit(gen);

        const double* a = X.row(seedRows[seedPos]);
        const double* b = X.row(poolRows[neighbors[seedPos][nnPos]]);
        for (int j = 0; j < d; ++j) {
            row[j] = a[j] + gap * (b[j] - a[j]);
        }
        if (finish) finish(seedPos, row.data());
        out.appendRow(row.data());
    }
}

double OverSampler::sampleBeta(double a, double b, std::mt19937& gen) {
    std::gamma_distribution<double> ga(a, 1.0);
    std::gamma_distribution<double> gb(b, 1.0);
    const double x = ga(gen);
    const double z = gb(gen);
    return x / (x + z);
}

std::vector<int> OverSampler::countOtherClass(const LabelVector& y,
                                              const std::vector<size_t>& poolRows,
                                              const std::vector<std::vector<size_t>>& neighbors,
                                              int cls) {
    std::vector<int> counts(neighbors.size(), 0);
    for (size_t i = 0; i < neighbors.size(); ++i) {
        for (size_t pos : neighbors[i]) {
            if (y.codes[poolRows[pos]] != cls) ++counts[i];
        }
    }
    return counts;
}

void OverSampler::requireClassSize(const LabelVector& y, int cls, size_t have, size_t need,
                                   const std::string& strategy) {
    if (have < need) {
        throw InsufficientSamplesError(strategy + ": class '" + y.classes[cls] + "' of '" + y.name +
                                       "' has " + std::to_string(have) + " samples, at least " +
                                       std::to_string(need) + " required");
    }
}
