#include "resampling/RandomOverSampler.hpp"

ResampleResult RandomOverSampler::fitResample(const FeatureMatrix& X, const LabelVector& y) const {
    return oversample(X, y, [&](int cls, size_t nSamples, std::mt19937& gen, FeatureMatrix& out) {
        const auto rows = classRows(y, cls);
        std::uniform_int_distribution<size_t> pick(0, rows.size() - 1);
        for (size_t s = 0; s < nSamples; ++s) {
            out.appendRow(X.row(rows[pick(gen)]));
        }
    });
}
