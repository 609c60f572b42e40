// =============================================================================
// include/evaluation/ScoringProcedure.hpp - Cross-validated accuracy for one resampled set
// =============================================================================
#pragma once

#include "classifier/IClassifier.hpp"
#include "core/Types.hpp"
#include "evaluation/ScoreLedger.hpp"
#include "visualization/IVisualizationSink.hpp"
#include "xgboost/core/XGBoostConfig.hpp"
#include <cstdint>
#include <string>

struct ScoringConfig {
    int folds = 10;
    bool shuffle = true;
    uint32_t seed = 20;
    XGBoostConfig classifier;       // seed follows ScoringConfig::seed
};

// Fresh XGBoostClassifier per call, configured from config.classifier
ClassifierFactory makeXGBoostFactory(const ScoringConfig& config);

/**
 * Stratified k-fold scoring of (X', y'). Fold accuracies and the
 * out-of-fold predictions come from the same folds; predictions are
 * compared against y'. Renders the confusion matrix of (y', predictions).
 *
 * @param original  labels of the active variant before resampling, reported
 *                  next to the resampled distribution
 * @throws InsufficientSamplesError when a class of y' has fewer than k rows
 */
EvaluationResult scoreResampled(const FeatureMatrix& X,
                                const LabelVector& y,
                                const LabelVector& original,
                                const std::string& strategy,
                                const ScoringConfig& config,
                                const ClassifierFactory& factory,
                                IVisualizationSink& sink);
