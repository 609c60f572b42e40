#pragma once

#include "xgboost/loss/IClassificationLoss.hpp"
#include <memory>
#include <string>
#include <vector>

class XGBoostLossFactory {
public:
    /**
     * @param objective binary:logistic, multi:softprob, multi:softmax or auto
     * @throws ConfigurationError for unknown objectives or a class count the
     *         objective cannot handle
     */
    static std::unique_ptr<IClassificationLoss> create(const std::string& objective, int numClasses);
};

class XGBoostLogisticLoss : public IClassificationLoss {
public:
    int numGroups() const override { return 1; }
    int numClasses() const override { return 2; }

    void computeGradientsHessians(
        const std::vector<int>& labels,
        const std::vector<double>& margins,
        std::vector<double>& gradients,
        std::vector<double>& hessians) const override;

    double computeBatchLoss(const std::vector<int>& labels,
                            const std::vector<double>& margins) const override;

    void transform(const double* margin, double* proba) const override;
    std::string name() const override { return "binary:logistic"; }
};

class XGBoostSoftmaxLoss : public IClassificationLoss {
public:
    explicit XGBoostSoftmaxLoss(int numClasses) : numClasses_(numClasses) {}

    int numGroups() const override { return numClasses_; }
    int numClasses() const override { return numClasses_; }

    void computeGradientsHessians(
        const std::vector<int>& labels,
        const std::vector<double>& margins,
        std::vector<double>& gradients,
        std::vector<double>& hessians) const override;

    double computeBatchLoss(const std::vector<int>& labels,
                            const std::vector<double>& margins) const override;

    void transform(const double* margin, double* proba) const override;
    std::string name() const override { return "multi:softprob"; }

private:
    int numClasses_;
};
