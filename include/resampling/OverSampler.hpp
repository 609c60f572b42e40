// =============================================================================
// include/resampling/OverSampler.hpp - Shared machinery for oversampling strategies
// =============================================================================
#pragma once

#include "resampling/IResampler.hpp"
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

/**
 * Base for strategies that grow every non-majority class to the majority
 * count. Output holds the input rows in input order followed by synthetic
 * rows, class by class in ascending class-code order.
 */
class OverSampler : public IResampler {
public:
    explicit OverSampler(uint32_t seed) : seed_(seed) {}

    uint32_t seed() const { return seed_; }

protected:
    // Appends nSamples synthetic rows of class cls to out
    using ClassSampler = std::function<void(int cls,
                                            size_t nSamples,
                                            std::mt19937& gen,
                                            FeatureMatrix& out)>;

    /**
     * Validates inputs, copies them, and calls sampleClass once per class
     * that needs new rows. The generator is reseeded from seed_ on every call.
     */
    ResampleResult oversample(const FeatureMatrix& X,
                              const LabelVector& y,
                              const ClassSampler& sampleClass) const;

    static std::vector<size_t> classRows(const LabelVector& y, int cls);

    /**
     * Interpolation between seed rows and their neighbours:
     *   new = seed + step * U[0,1) * (neighbour - seed)
     * neighbours[i] holds positions into poolRows for seedRows[i].
     * finish, when set, may rewrite each new row given the seed position.
     */
    static void makeSamples(const FeatureMatrix& X,
                            const std::vector<size_t>& seedRows,
                            const std::vector<size_t>& poolRows,
                            const std::vector<std::vector<size_t>>& neighbors,
                            size_t nSamples,
                            double stepSize,
                            std::mt19937& gen,
                            FeatureMatrix& out,
                            const std::function<void(size_t seedPos, double* row)>& finish = nullptr);

    // Beta(a, b) draw from two gamma variates
    static double sampleBeta(double a, double b, std::mt19937& gen);

    // Number of neighbours in `neighbors` rows whose class differs from cls
    static std::vector<int> countOtherClass(const LabelVector& y,
                                            const std::vector<size_t>& poolRows,
                                            const std::vector<std::vector<size_t>>& neighbors,
                                            int cls);

    static void requireClassSize(const LabelVector& y, int cls, size_t have, size_t need,
                                 const std::string& strategy);

private:
    uint32_t seed_;
};
