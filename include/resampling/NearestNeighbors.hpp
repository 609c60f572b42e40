#pragma once

#include "core/Types.hpp"
#include <vector>

/**
 * Brute-force k-nearest-neighbour search over a pool of rows of one matrix.
 *
 * Distance is squared Euclidean over continuous columns; columns flagged as
 * categorical contribute a fixed penalty when the values differ.
 * Neighbour lists hold positions into the pool, ordered by distance with
 * ties broken by pool position.
 */
class NearestNeighbors {
public:
    explicit NearestNeighbors(int k) : k_(k) {}

    void setCategorical(const std::vector<int>& columns, int rowLength, double penalty);

    void fit(const FeatureMatrix& data, std::vector<size_t> poolRows);

    /**
     * Neighbours of each query row (a row index of the fitted matrix).
     * When excludeSelf is set the query row itself is never returned.
     * @throws InsufficientSamplesError if the pool has fewer than k candidates
     */
    std::vector<std::vector<size_t>> kneighbors(const std::vector<size_t>& queryRows,
                                                bool excludeSelf = true) const;

    const std::vector<size_t>& poolRows() const { return poolRows_; }
    int k() const { return k_; }

private:
    int k_;
    const FeatureMatrix* data_ = nullptr;
    std::vector<size_t> poolRows_;
    std::vector<char> categoricalMask_;
    double categoricalPenalty_ = 0.0;

    double distance(const double* a, const double* b) const;
};
