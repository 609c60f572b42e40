#pragma once

#include "resampling/OverSampler.hpp"

/** Duplicates uniformly drawn minority rows (with replacement). */
class RandomOverSampler : public OverSampler {
public:
    explicit RandomOverSampler(uint32_t seed = 0) : OverSampler(seed) {}

    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override;
    std::string name() const override { return "RandomOverSampler"; }
};
