#include "resampling/NearestNeighbors.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

void NearestNeighbors::setCategorical(const std::vector<int>& columns, int rowLength, double penalty) {
    categoricalMask_.assign(rowLength, 0);
    for (int c : columns) {
        if (c >= 0 && c < rowLength) categoricalMask_[c] = 1;
    }
    categoricalPenalty_ = penalty;
}

void NearestNeighbors::fit(const FeatureMatrix& data, std::vector<size_t> poolRows) {
    data_ = &data;
    poolRows_ = std::move(poolRows);
}

double NearestNeighbors::distance(const double* a, const double* b) const {
    const int d = data_->rowLength();
    double sum = 0.0;
    if (categoricalMask_.empty()) {
        for (int j = 0; j < d; ++j) {
            const double diff = a[j] - b[j];
            sum += diff * diff;
        }
        return sum;
    }
    for (int j = 0; j < d; ++j) {
        if (categoricalMask_[j]) {
            if (a[j] != b[j]) sum += categoricalPenalty_;
        } else {
            const double diff = a[j] - b[j];
            sum += diff * diff;
        }
    }
    return sum;
}

std::vector<std::vector<size_t>> NearestNeighbors::kneighbors(const std::vector<size_t>& queryRows,
                                                              bool excludeSelf) const {
    if (!data_) {
        throw ConfigurationError("NearestNeighbors used before fit");
    }

    std::vector<char> inPool(data_->rows(), 0);
    for (size_t r : poolRows_) inPool[r] = 1;

    for (size_t q : queryRows) {
        const size_t candidates = poolRows_.size() - ((excludeSelf && inPool[q]) ? 1 : 0);
        if (candidates < static_cast<size_t>(k_)) {
            throw InsufficientSamplesError("expected n_neighbors <= n_samples, but n_samples = " +
                                           std::to_string(candidates) + ", n_neighbors = " +
                                           std::to_string(k_));
        }
    }

    const size_t numQueries = queryRows.size();
    std::vector<std::vector<size_t>> result(numQueries);

    #pragma omp parallel if(numQueries * poolRows_.size() > 100000)
    {
        std::vector<std::pair<double, size_t>> dist;
        dist.reserve(poolRows_.size());

        #pragma omp for schedule(dynamic, 64)
        for (long long qi = 0; qi < static_cast<long long>(numQueries); ++qi) {
            const size_t q = queryRows[qi];
            const double* qRow = data_->row(q);

            dist.clear();
            for (size_t p = 0; p < poolRows_.size(); ++p) {
                if (excludeSelf && poolRows_[p] == q) continue;
                dist.emplace_back(distance(qRow, data_->row(poolRows_[p])), p);
            }

            std::partial_sort(dist.begin(), dist.begin() + k_, dist.end());

            auto& out = result[qi];
            out.resize(k_);
            for (int j = 0; j < k_; ++j) out[j] = dist[j].second;
        }
    }

    return result;
}
