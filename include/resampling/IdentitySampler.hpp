#pragma once

#include "resampling/IResampler.hpp"

// Baseline strategy: hands back the input unchanged
class IdentitySampler : public IResampler {
public:
    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override {
        return ResampleResult{X, y};
    }

    std::string name() const override { return "Original"; }
};
