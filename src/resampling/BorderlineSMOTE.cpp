#include "resampling/BorderlineSMOTE.hpp"
#include "resampling/NearestNeighbors.hpp"
#include <numeric>

ResampleResult BorderlineSMOTE::fitResample(const FeatureMatrix& X, const LabelVector& y) const {
    std::vector<size_t> allRows(X.rows());
    std::iota(allRows.begin(), allRows.end(), 0);

    return oversample(X, y, [&](int cls, size_t nSamples, std::mt19937& gen, FeatureMatrix& out) {
        const auto rows = classRows(y, cls);
        requireClassSize(y, cls, rows.size(), kNeighbors_ + 1, name());

        NearestNeighbors nnM(mNeighbors_);
        nnM.fit(X, allRows);
        const auto otherCounts = countOtherClass(y, allRows, nnM.kneighbors(rows), cls);

        std::vector<size_t> danger;
        for (size_t i = 0; i < rows.size(); ++i) {
            if (2 * otherCounts[i] >= mNeighbors_ && otherCounts[i] < mNeighbors_) {
                danger.push_back(rows[i]);
            }
        }
        // Nothing on the border: every class row seeds, as plain SMOTE
        if (danger.empty()) {
            danger = rows;
        }

        NearestNeighbors nnK(kNeighbors_);
        nnK.fit(X, rows);
        const auto classNeighbors = nnK.kneighbors(danger);

        if (kind_ == Kind::Borderline1) {
            makeSamples(X, danger, rows, classNeighbors, nSamples, 1.0, gen, out);
            return;
        }

        const double fraction = sampleBeta(10.0, 10.0, gen);
        const auto nSameClass = static_cast<size_t>(fraction * (nSamples + 1));
        makeSamples(X, danger, rows, classNeighbors, nSameClass, 1.0, gen, out);

        NearestNeighbors nnAll(kNeighbors_);
        nnAll.fit(X, allRows);
        const auto anyNeighbors = nnAll.kneighbors(danger);
        makeSamples(X, danger, allRows, anyNeighbors, nSamples - nSameClass, 0.5, gen, out);
    });
}
