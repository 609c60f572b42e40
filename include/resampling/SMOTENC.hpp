#pragma once

#include "resampling/OverSampler.hpp"
#include <vector>

/**
 * SMOTE for mixed continuous/categorical rows. Continuous columns are
 * interpolated; categorical columns take the most frequent value among the
 * seed's nearest neighbours. The categorical column positions are fixed at
 * construction and checked against the matrix on every call.
 */
class SMOTENC : public OverSampler {
public:
    SMOTENC(std::vector<int> categoricalFeatures, uint32_t seed = 0, int kNeighbors = 5);

    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override;
    std::string name() const override { return "SMOTENC"; }

    const std::vector<int>& categoricalFeatures() const { return categoricalFeatures_; }

    /**
     * @throws ConfigurationError when an index is out of range, repeated,
     *         leaves no continuous column, or names a non-integer column
     */
    void validateCategorical(const FeatureMatrix& X) const;

private:
    std::vector<int> categoricalFeatures_;
    int kNeighbors_;

    double medianStd(const FeatureMatrix& X, const std::vector<size_t>& rows) const;
};
