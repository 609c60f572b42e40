#include "resampling/LinearSVM.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <random>

void LinearSVM::fit(const FeatureMatrix& X, const std::vector<char>& positive) {
    const size_t n = X.rows();
    const int d = X.rowLength();

    std::vector<size_t> pos, neg;
    for (size_t i = 0; i < n; ++i) {
        (positive[i] ? pos : neg).push_back(i);
    }
    if (pos.empty() || neg.empty()) {
        throw ConfigurationError("LinearSVM needs rows of both classes");
    }

    // Bias is learned as the weight of a constant feature
    w_.assign(d, 0.0);
    b_ = 0.0;

    std::mt19937 gen(seed_);
    std::bernoulli_distribution coin(0.5);
    std::uniform_int_distribution<size_t> pickPos(0, pos.size() - 1);
    std::uniform_int_distribution<size_t> pickNeg(0, neg.size() - 1);

    const size_t iterations = std::min(maxIterations_, std::max<size_t>(10 * n, 1000));
    const double radius = 1.0 / std::sqrt(lambda_);

    for (size_t t = 1; t <= iterations; ++t) {
        const bool takePositive = coin(gen);
        const size_t i = takePositive ? pos[pickPos(gen)] : neg[pickNeg(gen)];
        const double label = takePositive ? 1.0 : -1.0;
        const double eta = 1.0 / (lambda_ * static_cast<double>(t));
        const double margin = label * decision(X.row(i));
        const double shrink = 1.0 - eta * lambda_;

        for (int j = 0; j < d; ++j) w_[j] *= shrink;
        b_ *= shrink;

        if (margin < 1.0) {
            const double* row = X.row(i);
            for (int j = 0; j < d; ++j) w_[j] += eta * label * row[j];
            b_ += eta * label;
        }

        // Projection onto the ball of radius 1/sqrt(lambda)
        double norm = b_ * b_;
        for (double v : w_) norm += v * v;
        norm = std::sqrt(norm);
        if (norm > radius) {
            const double scale = radius / norm;
            for (double& v : w_) v *= scale;
            b_ *= scale;
        }
    }
}

double LinearSVM::decision(const double* row) const {
    double s = b_;
    for (size_t j = 0; j < w_.size(); ++j) s += w_[j] * row[j];
    return s;
}

std::vector<size_t> LinearSVM::supportVectors(const FeatureMatrix& X,
                                              const std::vector<char>& positive,
                                              const std::vector<size_t>& candidates) const {
    std::vector<size_t> support;
    for (size_t i : candidates) {
        const double label = positive[i] ? 1.0 : -1.0;
        if (label * decision(X.row(i)) <= 1.0) support.push_back(i);
    }
    return support;
}
