#include "pipeline/CrossValidation.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <random>

namespace {

void checkFoldCount(int k, size_t n) {
    if (k < 2) {
        throw ConfigurationError("number of folds must be at least 2, got " + std::to_string(k));
    }
    if (static_cast<size_t>(k) > n) {
        throw ConfigurationError("cannot split " + std::to_string(n) + " rows into " +
                                 std::to_string(k) + " folds");
    }
}

// Builds folds from a row -> fold assignment
std::vector<Fold> foldsFromAssignment(const std::vector<int>& foldOf, int k) {
    std::vector<Fold> folds(k);
    for (size_t i = 0; i < foldOf.size(); ++i) {
        for (int f = 0; f < k; ++f) {
            if (foldOf[i] == f) folds[f].testIdx.push_back(i);
            else folds[f].trainIdx.push_back(i);
        }
    }
    return folds;
}

} // namespace

StratifiedKFold::StratifiedKFold(int k, bool shuffle, uint32_t seed) : k_(k), shuffle_(shuffle), seed_(seed) {
    if (k_ < 2) {
        throw ConfigurationError("number of folds must be at least 2, got " + std::to_string(k_));
    }
}

std::vector<Fold> StratifiedKFold::split(const std::vector<int>& labels) const {
    const size_t n = labels.size();
    checkFoldCount(k_, n);

    std::map<int, std::vector<size_t>> byClass;
    for (size_t i = 0; i < n; ++i) byClass[labels[i]].push_back(i);

    for (const auto& [cls, rows] : byClass) {
        if (rows.size() < static_cast<size_t>(k_)) {
            throw InsufficientSamplesError("class " + std::to_string(cls) + " has " +
                                           std::to_string(rows.size()) + " rows, fewer than the " +
                                           std::to_string(k_) + " folds requested");
        }
    }

    std::mt19937 gen(seed_);
    std::vector<int> foldOf(n);
    // Continue the round-robin across classes so fold sizes stay within one row
    int next = 0;
    for (auto& [cls, rows] : byClass) {
        if (shuffle_) std::shuffle(rows.begin(), rows.end(), gen);
        for (size_t row : rows) {
            foldOf[row] = next;
            next = (next + 1) % k_;
        }
    }
    return foldsFromAssignment(foldOf, k_);
}

CrossValidationResult crossValidate(const ClassifierFactory& factory,
                                    const std::vector<double>& X,
                                    int rowLength,
                                    const std::vector<int>& labels,
                                    const IFoldSplitter& splitter) {
    const size_t n = labels.size();
    if (rowLength <= 0 || X.size() != n * static_cast<size_t>(rowLength)) {
        throw ConfigurationError("feature buffer does not match " + std::to_string(n) + " labels");
    }

    const auto folds = splitter.split(labels);

    CrossValidationResult result;
    result.predictions.assign(n, 0);
    result.foldScores.reserve(folds.size());

    std::vector<double> trainX, testX;
    std::vector<int> trainY;

    for (const auto& fold : folds) {
        trainX.clear();
        trainY.clear();
        testX.clear();
        trainX.reserve(fold.trainIdx.size() * rowLength);
        testX.reserve(fold.testIdx.size() * rowLength);

        for (size_t idx : fold.trainIdx) {
            trainX.insert(trainX.end(), X.begin() + idx * rowLength, X.begin() + (idx + 1) * rowLength);
            trainY.push_back(labels[idx]);
        }
        for (size_t idx : fold.testIdx) {
            testX.insert(testX.end(), X.begin() + idx * rowLength, X.begin() + (idx + 1) * rowLength);
        }

        auto model = factory();
        if (result.classifierName.empty()) result.classifierName = model->name();
        model->fit(trainX, rowLength, trainY);
        const auto predicted = model->predictBatch(testX, rowLength);

        size_t correct = 0;
        for (size_t j = 0; j < fold.testIdx.size(); ++j) {
            const size_t idx = fold.testIdx[j];
            result.predictions[idx] = predicted[j];
            if (predicted[j] == labels[idx]) ++correct;
        }
        result.foldScores.push_back(fold.testIdx.empty()
                                        ? 0.0
                                        : static_cast<double>(correct) / fold.testIdx.size());
    }

    const double k = static_cast<double>(result.foldScores.size());
    result.mean = std::accumulate(result.foldScores.begin(), result.foldScores.end(), 0.0) / k;
    double var = 0.0;
    for (double s : result.foldScores) var += (s - result.mean) * (s - result.mean);
    result.std = std::sqrt(var / k);

    return result;
}
