#pragma once

#include "core/Types.hpp"
#include <string>

struct ResampleResult {
    FeatureMatrix X;
    LabelVector y;
};

/**
 * Class-rebalancing strategy. Implementations never modify their inputs and
 * always return X.rows() == y.size().
 */
class IResampler {
public:
    virtual ~IResampler() = default;

    virtual ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const = 0;

    // Display name, unique within a run
    virtual std::string name() const = 0;
};
