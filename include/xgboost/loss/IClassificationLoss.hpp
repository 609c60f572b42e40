#pragma once

#include <string>
#include <vector>

/**
 * Second-order classification objective. Margins, gradients and hessians
 * are laid out row-major as n * numGroups(); labels are internal class
 * indices in [0, numClasses).
 */
class IClassificationLoss {
public:
    virtual ~IClassificationLoss() = default;

    // Trees grown per boosting round
    virtual int numGroups() const = 0;
    virtual int numClasses() const = 0;

    virtual void computeGradientsHessians(
        const std::vector<int>& labels,
        const std::vector<double>& margins,
        std::vector<double>& gradients,
        std::vector<double>& hessians) const = 0;

    // Mean negative log-likelihood
    virtual double computeBatchLoss(
        const std::vector<int>& labels,
        const std::vector<double>& margins) const = 0;

    // margin has numGroups() entries, proba receives numClasses()
    virtual void transform(const double* margin, double* proba) const = 0;

    virtual std::string name() const = 0;
};
