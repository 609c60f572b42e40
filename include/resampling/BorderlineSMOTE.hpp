#pragma once

#include "resampling/OverSampler.hpp"

/**
 * SMOTE restricted to minority rows near the class border ("danger" rows:
 * at least half, but not all, of their m nearest neighbours belong to other
 * classes).
 *
 * Kind 1 interpolates toward same-class neighbours only. Kind 2 also
 * interpolates half-way toward neighbours of any class.
 */
class BorderlineSMOTE : public OverSampler {
public:
    enum class Kind { Borderline1, Borderline2 };

    explicit BorderlineSMOTE(uint32_t seed = 0,
                             Kind kind = Kind::Borderline1,
                             int kNeighbors = 5,
                             int mNeighbors = 10)
        : OverSampler(seed), kind_(kind), kNeighbors_(kNeighbors), mNeighbors_(mNeighbors) {}

    ResampleResult fitResample(const FeatureMatrix& X, const LabelVector& y) const override;

    std::string name() const override {
        return kind_ == Kind::Borderline1 ? "BorderlineSMOTE-1" : "BorderlineSMOTE-2";
    }

    Kind getKind() const { return kind_; }

private:
    Kind kind_;
    int kNeighbors_;
    int mNeighbors_;
};
