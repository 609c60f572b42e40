#include "preprocessing/PowerTransformer.hpp"
#include <cmath>
#include <limits>
#include <numeric>

namespace preprocessing {

namespace {

constexpr double kLambdaLow = -5.0;
constexpr double kLambdaHigh = 5.0;
constexpr double kLambdaTol = 1e-6;
constexpr double kEps = 1e-12;

void meanAndVariance(const std::vector<double>& v, double& mean, double& var) {
    const double n = static_cast<double>(v.size());
    mean = std::accumulate(v.begin(), v.end(), 0.0) / n;
    var = 0.0;
    for (double x : v) var += (x - mean) * (x - mean);
    var /= n;
}

} // namespace

double PowerTransformer::yeoJohnson(double x, double lambda) {
    if (x >= 0.0) {
        if (std::abs(lambda) < kEps) return std::log1p(x);
        return (std::pow(x + 1.0, lambda) - 1.0) / lambda;
    }
    if (std::abs(lambda - 2.0) < kEps) return -std::log1p(-x);
    return -(std::pow(-x + 1.0, 2.0 - lambda) - 1.0) / (2.0 - lambda);
}

double PowerTransformer::logLikelihood(const std::vector<double>& x, double lambda) {
    std::vector<double> xt(x.size());
    double logTerm = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        xt[i] = yeoJohnson(x[i], lambda);
        logTerm += std::copysign(std::log1p(std::abs(x[i])), x[i]);
    }

    double mean = 0.0, var = 0.0;
    meanAndVariance(xt, mean, var);
    if (var <= 0.0 || !std::isfinite(var)) {
        return -std::numeric_limits<double>::infinity();
    }

    const double n = static_cast<double>(x.size());
    return -0.5 * n * std::log(var) + (lambda - 1.0) * logTerm;
}

void PowerTransformer::fit(const std::vector<double>& values) {
    lambda_ = 1.0;
    mean_ = 0.0;
    scale_ = 1.0;
    if (values.empty()) return;

    double mean = 0.0, var = 0.0;
    meanAndVariance(values, mean, var);

    if (var > kEps) {
        // Golden-section search for the maximum-likelihood lambda
        const double invPhi = (std::sqrt(5.0) - 1.0) / 2.0;
        double a = kLambdaLow, b = kLambdaHigh;
        double c = b - invPhi * (b - a);
        double d = a + invPhi * (b - a);
        double fc = logLikelihood(values, c);
        double fd = logLikelihood(values, d);

        while (b - a > kLambdaTol) {
            if (fc > fd) {
                b = d;
                d = c;
                fd = fc;
                c = b - invPhi * (b - a);
                fc = logLikelihood(values, c);
            } else {
                a = c;
                c = d;
                fc = fd;
                d = a + invPhi * (b - a);
                fd = logLikelihood(values, d);
            }
        }
        lambda_ = 0.5 * (a + b);
    }

    if (standardize_) {
        std::vector<double> xt(values.size());
        for (size_t i = 0; i < values.size(); ++i) xt[i] = yeoJohnson(values[i], lambda_);
        double tMean = 0.0, tVar = 0.0;
        meanAndVariance(xt, tMean, tVar);
        mean_ = tMean;
        scale_ = (tVar > kEps) ? std::sqrt(tVar) : 1.0;
    }
}

std::vector<double> PowerTransformer::transform(const std::vector<double>& values) const {
    std::vector<double> out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        double t = yeoJohnson(values[i], lambda_);
        if (standardize_) t = (t - mean_) / scale_;
        out[i] = t;
    }
    return out;
}

std::vector<double> PowerTransformer::fitTransform(const std::vector<double>& values) {
    fit(values);
    return transform(values);
}

} // namespace preprocessing
