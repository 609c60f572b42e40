#include "resampling/SVMSMOTE.hpp"
#include "resampling/LinearSVM.hpp"
#include "resampling/NearestNeighbors.hpp"
#include <numeric>

ResampleResult SVMSMOTE::fitResample(const FeatureMatrix& X, const LabelVector& y) const {
    std::vector<size_t> allRows(X.rows());
    std::iota(allRows.begin(), allRows.end(), 0);

    return oversample(X, y, [&](int cls, size_t nSamples, std::mt19937& gen, FeatureMatrix& out) {
        const auto rows = classRows(y, cls);
        requireClassSize(y, cls, rows.size(), kNeighbors_ + 1, name());

        std::vector<char> positive(X.rows(), 0);
        for (size_t r : rows) positive[r] = 1;

        LinearSVM svm(1e-3, 200000, seed() + static_cast<uint32_t>(cls));
        svm.fit(X, positive);
        auto support = svm.supportVectors(X, positive, rows);

        std::vector<size_t> danger, safe;
        if (!support.empty()) {
            NearestNeighbors nnM(mNeighbors_);
            nnM.fit(X, allRows);
            const auto otherCounts = countOtherClass(y, allRows, nnM.kneighbors(support), cls);
            for (size_t i = 0; i < support.size(); ++i) {
                if (otherCounts[i] == mNeighbors_) continue;  // noise
                if (2 * otherCounts[i] >= mNeighbors_) {
                    danger.push_back(support[i]);
                } else {
                    safe.push_back(support[i]);
                }
            }
        }
        // No usable support vector: fall back to plain SMOTE seeds
        if (danger.empty() && safe.empty()) {
            danger = rows;
        }

        NearestNeighbors nnK(kNeighbors_);
        nnK.fit(X, rows);

        size_t nDanger = nSamples;
        if (!danger.empty() && !safe.empty()) {
            const double fraction = sampleBeta(10.0, 10.0, gen);
            nDanger = static_cast<size_t>(fraction * (nSamples + 1));
        } else if (danger.empty()) {
            nDanger = 0;
        }

        if (nDanger > 0) {
            makeSamples(X, danger, rows, nnK.kneighbors(danger), nDanger, 1.0, gen, out);
        }
        if (nSamples > nDanger) {
            makeSamples(X, safe, rows, nnK.kneighbors(safe), nSamples - nDanger, -outStep_, gen, out);
        }
    });
}
