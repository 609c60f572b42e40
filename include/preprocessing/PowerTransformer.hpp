#pragma once

#include <vector>

namespace preprocessing {

/**
 * Yeo-Johnson power transform with maximum-likelihood lambda,
 * optionally followed by zero-mean / unit-variance standardization.
 */
class PowerTransformer {
public:
    explicit PowerTransformer(bool standardize = true) : standardize_(standardize) {}

    void fit(const std::vector<double>& values);
    std::vector<double> transform(const std::vector<double>& values) const;
    std::vector<double> fitTransform(const std::vector<double>& values);

    double lambda() const { return lambda_; }

    static double yeoJohnson(double x, double lambda);

private:
    bool standardize_;
    double lambda_ = 1.0;
    double mean_ = 0.0;
    double scale_ = 1.0;

    static double logLikelihood(const std::vector<double>& x, double lambda);
};

} // namespace preprocessing
