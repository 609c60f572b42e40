#pragma once

#include "classifier/IClassifier.hpp"
#include "xgboost/core/XGBoostConfig.hpp"
#include "xgboost/model/XGBoostModel.hpp"
#include "xgboost/loss/XGBoostLossFactory.hpp"
#include "xgboost/criterion/XGBoostCriterion.hpp"
#include <memory>
#include <random>
#include <tuple>
#include <vector>

// Per-feature presorted row order over a row-major buffer
struct ColumnData {
    std::vector<std::vector<int>> sortedIndices;
    const std::vector<double>* values = nullptr;
    int numFeatures;
    size_t numSamples;

    ColumnData(int features, size_t samples) : numFeatures(features), numSamples(samples) {
        sortedIndices.resize(features);
    }

    // Row-major position; full-size oversampled sets pass INT_MAX cells
    size_t offset(int row, int feature) const {
        return static_cast<size_t>(row) * static_cast<size_t>(numFeatures) + static_cast<size_t>(feature);
    }

    double at(int row, int feature) const { return (*values)[offset(row, feature)]; }
};

/**
 * Gradient-boosted tree classifier with second-order split search.
 * Two classes train a single logistic group; more classes train one
 * softmax group per class. Training is deterministic for a given seed.
 */
class XGBoostClassifier : public IClassifier {
public:
    /** @throws ConfigurationError on out-of-range parameters */
    explicit XGBoostClassifier(const XGBoostConfig& config = XGBoostConfig());

    void fit(const std::vector<double>& X, int rowLength, const std::vector<int>& labels) override;
    int predict(const double* sample, int rowLength) const override;
    std::vector<int> predictBatch(const std::vector<double>& X, int rowLength) const override;

    // Class probabilities in classes() order
    std::vector<double> predictProba(const double* sample, int rowLength) const;

    std::string name() const override { return "XGBClassifier"; }
    std::string shortName() const override { return "XGC"; }

    const XGBoostConfig& config() const { return config_; }
    const std::vector<int>& classes() const { return classes_; }
    const XGBoostModel& model() const { return model_; }
    const std::vector<double>& getTrainingLoss() const { return trainingLoss_; }
    std::vector<double> getFeatureImportance() const { return model_.getFeatureImportance(rowLength_); }

private:
    XGBoostConfig config_;
    XGBoostModel model_;
    std::unique_ptr<IClassificationLoss> lossFunction_;
    XGBoostCriterion xgbCriterion_;

    std::vector<int> classes_;
    std::vector<double> trainingLoss_;
    int rowLength_ = 0;
    bool fitted_ = false;

    std::unique_ptr<Node> trainSingleTree(const ColumnData& columnData,
                                          const std::vector<double>& gradients,
                                          const std::vector<double>& hessians,
                                          const std::vector<char>& rootMask,
                                          const std::vector<char>& featureMask) const;

    void buildXGBNode(Node* node,
                      const ColumnData& columnData,
                      const std::vector<double>& gradients,
                      const std::vector<double>& hessians,
                      const std::vector<char>& nodeMask,
                      const std::vector<char>& featureMask,
                      int depth) const;

    std::tuple<int, double, double> findBestSplitXGB(
        const ColumnData& columnData,
        const std::vector<double>& gradients,
        const std::vector<double>& hessians,
        const std::vector<char>& nodeMask,
        const std::vector<char>& featureMask,
        double G_parent, double H_parent, int sampleCount) const;

    void sampleRows(std::mt19937& gen, std::vector<char>& rootMask) const;
    void sampleFeatures(std::mt19937& gen, std::vector<char>& featureMask) const;

    void checkFitted(int rowLength) const;
};
