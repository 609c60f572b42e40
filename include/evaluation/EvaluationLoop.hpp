// =============================================================================
// include/evaluation/EvaluationLoop.hpp - Strategy x label evaluation matrix
// =============================================================================
#pragma once

#include "classifier/IClassifier.hpp"
#include "core/Types.hpp"
#include "evaluation/ScoreLedger.hpp"
#include "evaluation/ScoringProcedure.hpp"
#include "resampling/IResampler.hpp"
#include "visualization/IVisualizationSink.hpp"
#include <memory>
#include <vector>

/**
 * Inputs and the single mutable output of a run. The matrix and the two
 * label vectors are owned by the caller and only read here.
 */
struct RunContext {
    const FeatureMatrix& X;
    const LabelVector& fine;        // attack_category
    const LabelVector& coarse;      // target
    ScoreLedger& ledger;
    const ScoringConfig& scoring;
    IVisualizationSink& sink;
};

/**
 * For each strategy, then for the fine and the coarse label: resample,
 * score, record. A bar chart of the resampled fine-label distribution is
 * rendered after each fine-label pass. The first exception ends the run.
 */
void runEvaluation(RunContext& context,
                   const std::vector<std::unique_ptr<IResampler>>& strategies,
                   const ClassifierFactory& factory);
