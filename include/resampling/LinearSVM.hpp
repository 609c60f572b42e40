#pragma once

#include "core/Types.hpp"
#include <cstdint>
#include <vector>

/**
 * One-vs-rest linear SVM trained with Pegasos (stochastic sub-gradient on
 * the regularized hinge loss). Positive and negative rows are drawn with
 * equal probability so a small positive class is not ignored.
 */
class LinearSVM {
public:
    explicit LinearSVM(double lambda = 1e-3,
                       size_t maxIterations = 200000,
                       uint32_t seed = 0)
        : lambda_(lambda), maxIterations_(maxIterations), seed_(seed) {}

    // positive[i] != 0 marks row i as the positive class
    void fit(const FeatureMatrix& X, const std::vector<char>& positive);

    double decision(const double* row) const;

    /**
     * Rows among candidates whose functional margin y * f(x) is at most 1,
     * i.e. on or inside the margin.
     */
    std::vector<size_t> supportVectors(const FeatureMatrix& X,
                                       const std::vector<char>& positive,
                                       const std::vector<size_t>& candidates) const;

    const std::vector<double>& weights() const { return w_; }
    double bias() const { return b_; }

private:
    double lambda_;
    size_t maxIterations_;
    uint32_t seed_;
    std::vector<double> w_;
    double b_ = 0.0;
};
