#include "evaluation/ScoringProcedure.hpp"
#include "pipeline/CrossValidation.hpp"
#include "xgboost/trainer/XGBoostClassifier.hpp"
#include <iomanip>
#include <iostream>
#include <memory>

ClassifierFactory makeXGBoostFactory(const ScoringConfig& config) {
    XGBoostConfig xgb = config.classifier;
    xgb.seed = config.seed;
    // Reject bad parameters before the loop starts
    XGBoostClassifier check(xgb);
    return [xgb]() -> std::unique_ptr<IClassifier> {
        return std::make_unique<XGBoostClassifier>(xgb);
    };
}

namespace {

void printCounts(const std::string& caption, const LabelVector& labels) {
    std::cout << caption << ":";
    for (const auto& [name, count] : labels.valueCounts()) {
        std::cout << " " << name << "=" << count;
    }
    std::cout << std::endl;
}

} // namespace

EvaluationResult scoreResampled(const FeatureMatrix& X,
                                const LabelVector& y,
                                const LabelVector& original,
                                const std::string& strategy,
                                const ScoringConfig& config,
                                const ClassifierFactory& factory,
                                IVisualizationSink& sink) {
    StratifiedKFold kfold(config.folds, config.shuffle, config.seed);
    const auto cv = crossValidate(factory, X.values, X.rowLength(), y.codes, kfold);

    std::cout << strategy << " - " << y.name << " - XGBoost Accuracy: "
              << std::fixed << std::setprecision(2) << cv.mean * 100.0
              << "% (+/- " << cv.std * 100.0 << ")" << std::defaultfloat << std::endl;
    printCounts("  original distribution", original);
    printCounts("  resampled distribution", y);

    sink.confusionMatrix(y.codes, cv.predictions, y.classes,
                         strategy + " - " + cv.classifierName + " - Label " + y.name);

    EvaluationResult result;
    result.strategy = strategy;
    result.label = y.name;
    result.meanAccuracy = cv.mean;
    result.stdAccuracy = cv.std;
    result.predictions = cv.predictions;
    result.foldScores = cv.foldScores;
    result.resampledCounts = y.valueCounts();
    return result;
}
