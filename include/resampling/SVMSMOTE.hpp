#pragma once

#include "resampling/OverSampler.hpp"

/**
 * SMOTE seeded from the minority support vectors of a one-vs-rest linear
 * SVM. Support vectors in danger interpolate toward same-class neighbours;
 * safe ones extrapolate away from them by outStep.
 */
class SVMSMOTE : public OverSampler {
public:
    explicit SVMSMOTE(uint32_t seed = 0,
                      int kNeighbors = 5,
                      int mNeighbors = 10,
                      double outStep = 0.5)
        : OverSampler(seed), kNeighbors_(kNeighbors), mNeighbors_(mNeighbors), outStep_(outStep) {}

    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override;
    std::string name() const override { return "SVMSMOTE"; }

private:
    int kNeighbors_;
    int mNeighbors_;
    double outStep_;
};
