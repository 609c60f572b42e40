#pragma once

#include "resampling/OverSampler.hpp"

/**
 * Synthetic Minority Over-sampling: new rows are interpolated between a
 * minority row and one of its k nearest same-class neighbours.
 */
class SMOTE : public OverSampler {
public:
    explicit SMOTE(uint32_t seed = 0, int kNeighbors = 5)
        : OverSampler(seed), kNeighbors_(kNeighbors) {}

    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override;
    std::string name() const override { return "SMOTE"; }

    int getKNeighbors() const { return kNeighbors_; }

private:
    int kNeighbors_;
};
