#include "resampling/SMOTE.hpp"
#include "resampling/NearestNeighbors.hpp"

ResampleResult SMOTE::fitResample(const FeatureMatrix& X, const LabelVector& y) const {
    return oversample(X, y, [&](int cls, size_t nSamples, std::mt19937& gen, FeatureMatrix& out) {
        const auto rows = classRows(y, cls);
        requireClassSize(y, cls, rows.size(), kNeighbors_ + 1, name());

        NearestNeighbors nn(kNeighbors_);
        nn.fit(X, rows);
        const auto neighbors = nn.kneighbors(rows);

        makeSamples(X, rows, rows, neighbors, nSamples, 1.0, gen, out);
    });
}
