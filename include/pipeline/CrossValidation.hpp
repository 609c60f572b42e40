// =============================================================================
// include/pipeline/CrossValidation.hpp - Fold splitters and cross-validated scoring
// =============================================================================
#pragma once

#include "classifier/IClassifier.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct Fold {
    std::vector<size_t> trainIdx;   // ascending
    std::vector<size_t> testIdx;    // ascending
};

class IFoldSplitter {
public:
    virtual ~IFoldSplitter() = default;

    // Every row index lands in exactly one testIdx
    virtual std::vector<Fold> split(const std::vector<int>& labels) const = 0;

    virtual int numFolds() const = 0;
};

/**
 * Stratified k-fold. Rows of each class are dealt round-robin over the folds,
 * so each fold keeps the class proportions to within one row per class.
 */
class StratifiedKFold : public IFoldSplitter {
public:
    StratifiedKFold(int k, bool shuffle = false, uint32_t seed = 0);

    /** @throws InsufficientSamplesError when a present class has fewer than k rows */
    std::vector<Fold> split(const std::vector<int>& labels) const override;
    int numFolds() const override { return k_; }

private:
    int k_;
    bool shuffle_;
    uint32_t seed_;
};

struct CrossValidationResult {
    std::vector<double> foldScores;
    double mean = 0.0;
    double std = 0.0;                 // population standard deviation
    std::vector<int> predictions;     // out-of-fold prediction for every row
    std::string classifierName;       // name() of the fold models
};

/**
 * Fits a fresh classifier per fold and scores accuracy on the held-out rows.
 * The same pass fills the out-of-fold prediction vector.
 */
CrossValidationResult crossValidate(const ClassifierFactory& factory,
                                    const std::vector<double>& X,
                                    int rowLength,
                                    const std::vector<int>& labels,
                                    const IFoldSplitter& splitter);
