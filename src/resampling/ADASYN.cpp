#include "resampling/ADASYN.hpp"
#include "resampling/NearestNeighbors.hpp"
#include <cmath>
#include <numeric>

ResampleResult ADASYN::fitResample(const FeatureMatrix& X, const LabelVector& y) const {
    std::vector<size_t> allRows(X.rows());
    std::iota(allRows.begin(), allRows.end(), 0);

    return oversample(X, y, [&](int cls, size_t nSamples, std::mt19937& gen, FeatureMatrix& out) {
        const auto rows = classRows(y, cls);
        requireClassSize(y, cls, rows.size(), nNeighbors_ + 1, name());

        // Density of other classes around every minority row
        NearestNeighbors nnAll(nNeighbors_);
        nnAll.fit(X, allRows);
        const auto otherCounts = countOtherClass(y, allRows, nnAll.kneighbors(rows), cls);

        std::vector<double> ratio(rows.size());
        double total = 0.0;
        for (size_t i = 0; i < rows.size(); ++i) {
            ratio[i] = static_cast<double>(otherCounts[i]) / nNeighbors_;
            total += ratio[i];
        }

        NearestNeighbors nnClass(nNeighbors_);
        nnClass.fit(X, rows);
        const auto neighbors = nnClass.kneighbors(rows);

        // No other class nearby: no density to adapt to, draw as plain SMOTE
        if (total <= 0.0) {
            makeSamples(X, rows, rows, neighbors, nSamples, 1.0, gen, out);
            return;
        }

        std::uniform_int_distribution<int> pickNeighbor(0, nNeighbors_ - 1);
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        const int d = X.rowLength();
        std::vector<double> row(d);

        for (size_t i = 0; i < rows.size(); ++i) {
            const auto perRow = static_cast<size_t>(std::nearbyint(ratio[i] / total * nSamples));
            const double* a = X.row(rows[i]);
            for (size_t s = 0; s < perRow; ++s) {
                const double* b = X.row(rows[neighbors[i][pickNeighbor(gen)]]);
                const double gap = unit(gen);
                for (int j = 0; j < d; ++j) {
                    row[j] = a[j] + gap * (b[j] - a[j]);
                }
                out.appendRow(row.data());
            }
        }
    });
}
