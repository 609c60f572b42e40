// =============================================================================
// src/xgboost/loss/XGBoostLossFactory.cpp
// =============================================================================
#include "xgboost/loss/XGBoostLossFactory.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

constexpr double kMinHessian = 1e-16;
constexpr double kMinProb = 1e-15;

double sigmoid(double z) {
    z = std::max(-250.0, std::min(250.0, z));
    return 1.0 / (1.0 + std::exp(-z));
}

} // namespace

std::unique_ptr<IClassificationLoss> XGBoostLossFactory::create(const std::string& objective, int numClasses) {
    if (numClasses < 2) {
        throw ConfigurationError("objective " + objective + " needs at least two classes");
    }
    if (objective == "binary:logistic" || (objective == "auto" && numClasses == 2)) {
        if (numClasses != 2) {
            throw ConfigurationError("binary:logistic needs exactly two classes, got " + std::to_string(numClasses));
        }
        return std::make_unique<XGBoostLogisticLoss>();
    }
    else if (objective == "multi:softprob" || objective == "multi:softmax" || objective == "auto") {
        return std::make_unique<XGBoostSoftmaxLoss>(numClasses);
    }
    throw ConfigurationError("Unsupported objective: " + objective);
}

// Logistic loss on a single margin per row

void XGBoostLogisticLoss::computeGradientsHessians(
    const std::vector<int>& labels,
    const std::vector<double>& margins,
    std::vector<double>& gradients,
    std::vector<double>& hessians) const {

    const size_t n = labels.size();
    gradients.resize(n);
    hessians.resize(n);

    #pragma omp parallel for schedule(static, 1024) if(n > 2000)
    for (size_t i = 0; i < n; ++i) {
        const double p = sigmoid(margins[i]);
        gradients[i] = p - static_cast<double>(labels[i]);
        hessians[i] = std::max(p * (1.0 - p), kMinHessian);
    }
}

double XGBoostLogisticLoss::computeBatchLoss(const std::vector<int>& labels,
                                             const std::vector<double>& margins) const {
    double total = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const double p = std::min(std::max(sigmoid(margins[i]), kMinProb), 1.0 - kMinProb);
        total -= labels[i] == 1 ? std::log(p) : std::log(1.0 - p);
    }
    return labels.empty() ? 0.0 : total / labels.size();
}

void XGBoostLogisticLoss::transform(const double* margin, double* proba) const {
    const double p = sigmoid(margin[0]);
    proba[0] = 1.0 - p;
    proba[1] = p;
}

// Softmax loss, one margin per class per row

void XGBoostSoftmaxLoss::computeGradientsHessians(
    const std::vector<int>& labels,
    const std::vector<double>& margins,
    std::vector<double>& gradients,
    std::vector<double>& hessians) const {

    const size_t n = labels.size();
    const int K = numClasses_;
    gradients.resize(n * K);
    hessians.resize(n * K);

    #pragma omp parallel if(n > 2000)
    {
        std::vector<double> p(K);

        #pragma omp for schedule(static, 1024)
        for (size_t i = 0; i < n; ++i) {
            transform(&margins[i * K], p.data());
            for (int k = 0; k < K; ++k) {
                const double target = (labels[i] == k) ? 1.0 : 0.0;
                gradients[i * K + k] = p[k] - target;
                hessians[i * K + k] = std::max(2.0 * p[k] * (1.0 - p[k]), kMinHessian);
            }
        }
    }
}

double XGBoostSoftmaxLoss::computeBatchLoss(const std::vector<int>& labels,
                                            const std::vector<double>& margins) const {
    const int K = numClasses_;
    std::vector<double> p(K);
    double total = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        transform(&margins[i * K], p.data());
        total -= std::log(std::max(p[labels[i]], kMinProb));
    }
    return labels.empty() ? 0.0 : total / labels.size();
}

void XGBoostSoftmaxLoss::transform(const double* margin, double* proba) const {
    const double maxMargin = *std::max_element(margin, margin + numClasses_);
    double sum = 0.0;
    for (int k = 0; k < numClasses_; ++k) {
        proba[k] = std::exp(margin[k] - maxMargin);
        sum += proba[k];
    }
    for (int k = 0; k < numClasses_; ++k) proba[k] /= sum;
}
