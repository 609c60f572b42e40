#pragma once

#include "resampling/OverSampler.hpp"

/**
 * Adaptive synthetic sampling: minority rows surrounded by more
 * other-class neighbours receive proportionally more synthetic rows.
 */
class ADASYN : public OverSampler {
public:
    explicit ADASYN(uint32_t seed = 0, int nNeighbors = 5)
        : OverSampler(seed), nNeighbors_(nNeighbors) {}

    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override;
    std::string name() const override { return "ADASYN"; }

private:
    int nNeighbors_;
};
