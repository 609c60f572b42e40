#include "xgboost/trainer/XGBoostClassifier.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <limits>
#include <cmath>
#ifdef _OPENMP
#include <omp.h>
#endif

XGBoostClassifier::XGBoostClassifier(const XGBoostConfig& config)
    : config_(config), xgbCriterion_(config.lambda, config.alpha) {
    if (config_.numRounds < 1) {
        throw ConfigurationError("numRounds must be positive, got " + std::to_string(config_.numRounds));
    }
    if (!(config_.eta > 0.0)) {
        throw ConfigurationError("eta must be positive");
    }
    if (config_.maxDepth < 0) {
        throw ConfigurationError("maxDepth must not be negative");
    }
    if (!(config_.subsample > 0.0 && config_.subsample <= 1.0) ||
        !(config_.colsampleByTree > 0.0 && config_.colsampleByTree <= 1.0)) {
        throw ConfigurationError("subsample and colsampleByTree must lie in (0, 1]");
    }
    if (config_.lambda < 0.0 || config_.alpha < 0.0 || config_.gamma < 0.0) {
        throw ConfigurationError("lambda, alpha and gamma must not be negative");
    }
    trainingLoss_.reserve(config_.numRounds);
}

void XGBoostClassifier::fit(const std::vector<double>& data, int rowLength, const std::vector<int>& labels) {
    const size_t n = labels.size();
    if (rowLength <= 0 || n == 0 || data.size() != n * static_cast<size_t>(rowLength)) {
        throw ConfigurationError("XGBClassifier::fit expects " + std::to_string(n) + " rows of " +
                                 std::to_string(rowLength) + " features, got " +
                                 std::to_string(data.size()) + " values");
    }

    rowLength_ = rowLength;
    trainingLoss_.clear();

    classes_ = labels;
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());

    // A single class needs no trees
    if (classes_.size() < 2) {
        lossFunction_.reset();
        model_.reset(1, 0.0);
        fitted_ = true;
        return;
    }

    const int K = static_cast<int>(classes_.size());
    std::vector<int> target(n);
    for (size_t i = 0; i < n; ++i) {
        target[i] = static_cast<int>(std::lower_bound(classes_.begin(), classes_.end(), labels[i]) - classes_.begin());
    }

    lossFunction_ = XGBoostLossFactory::create(config_.objective, K);
    const int G = lossFunction_->numGroups();

    ColumnData columnData(rowLength, n);
    columnData.values = &data;

    #pragma omp parallel for schedule(dynamic) if(rowLength > 4)
    for (int f = 0; f < rowLength; ++f) {
        columnData.sortedIndices[f].resize(n);
        std::iota(columnData.sortedIndices[f].begin(), columnData.sortedIndices[f].end(), 0);
        std::stable_sort(columnData.sortedIndices[f].begin(), columnData.sortedIndices[f].end(),
                         [&](int a, int b) { return columnData.at(a, f) < columnData.at(b, f); });
    }

    // Zero margin is probability 0.5 for logistic and uniform for softmax
    model_.reset(G, 0.0);

    std::vector<double> margins(n * G, model_.getBaseScore());
    std::vector<double> gradients, hessians;
    std::vector<double> groupGrad(n), groupHess(n);
    std::vector<char> rootMask(n, 1);
    std::vector<char> featureMask(rowLength, 1);
    std::mt19937 gen(config_.seed);

    for (int round = 0; round < config_.numRounds; ++round) {
        const double currentLoss = lossFunction_->computeBatchLoss(target, margins);
        trainingLoss_.push_back(currentLoss);
        if (config_.verbose && round % 10 == 0) {
            std::cout << "  round " << round << " loss " << currentLoss << std::endl;
        }

        lossFunction_->computeGradientsHessians(target, margins, gradients, hessians);

        sampleRows(gen, rootMask);
        sampleFeatures(gen, featureMask);

        for (int g = 0; g < G; ++g) {
            for (size_t i = 0; i < n; ++i) {
                groupGrad[i] = gradients[i * G + g];
                groupHess[i] = hessians[i * G + g];
            }

            auto tree = trainSingleTree(columnData, groupGrad, groupHess, rootMask, featureMask);

            #pragma omp parallel for schedule(static, 256) if(n > 1000)
            for (size_t i = 0; i < n; ++i) {
                const Node* leaf = tree->route(&data[i * rowLength]);
                if (leaf) margins[i * G + g] += config_.eta * leaf->getPrediction();
            }
            model_.addTree(std::move(tree), config_.eta, g);
        }
    }

    fitted_ = true;
}

void XGBoostClassifier::sampleRows(std::mt19937& gen, std::vector<char>& rootMask) const {
    const size_t n = rootMask.size();
    if (config_.subsample >= 1.0) {
        std::fill(rootMask.begin(), rootMask.end(), 1);
        return;
    }
    const size_t sampleSize = std::max<size_t>(1, static_cast<size_t>(n * config_.subsample));
    std::vector<int> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), gen);

    std::fill(rootMask.begin(), rootMask.end(), 0);
    for (size_t i = 0; i < sampleSize; ++i) {
        rootMask[indices[i]] = 1;
    }
}

void XGBoostClassifier::sampleFeatures(std::mt19937& gen, std::vector<char>& featureMask) const {
    const size_t d = featureMask.size();
    if (config_.colsampleByTree >= 1.0) {
        std::fill(featureMask.begin(), featureMask.end(), 1);
        return;
    }
    const size_t keep = std::max<size_t>(1, static_cast<size_t>(d * config_.colsampleByTree));
    std::vector<int> indices(d);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), gen);

    std::fill(featureMask.begin(), featureMask.end(), 0);
    for (size_t i = 0; i < keep; ++i) {
        featureMask[indices[i]] = 1;
    }
}

std::unique_ptr<Node> XGBoostClassifier::trainSingleTree(const ColumnData& columnData,
                                                         const std::vector<double>& gradients,
                                                         const std::vector<double>& hessians,
                                                         const std::vector<char>& rootMask,
                                                         const std::vector<char>& featureMask) const {
    auto root = std::make_unique<Node>();
    buildXGBNode(root.get(), columnData, gradients, hessians, rootMask, featureMask, 0);
    return root;
}

void XGBoostClassifier::buildXGBNode(Node* node,
                                     const ColumnData& columnData,
                                     const std::vector<double>& gradients,
                                     const std::vector<double>& hessians,
                                     const std::vector<char>& nodeMask,
                                     const std::vector<char>& featureMask,
                                     int depth) const {
    const size_t n = nodeMask.size();

    // Serial sums keep results independent of the thread count
    double G_parent = 0.0, H_parent = 0.0;
    int sampleCount = 0;
    for (size_t i = 0; i < n; ++i) {
        if (nodeMask[i]) {
            G_parent += gradients[i];
            H_parent += hessians[i];
            ++sampleCount;
        }
    }

    node->samples = sampleCount;
    node->cover = H_parent;
    const double leafWeight = xgbCriterion_.computeLeafWeight(G_parent, H_parent);

    if (depth >= config_.maxDepth || sampleCount < 2 || H_parent < config_.minChildWeight) {
        node->makeLeaf(leafWeight);
        return;
    }

    auto [bestFeature, bestThreshold, bestGain] =
        findBestSplitXGB(columnData, gradients, hessians, nodeMask, featureMask, G_parent, H_parent, sampleCount);

    if (bestFeature < 0 || bestGain <= 0.0) {
        node->makeLeaf(leafWeight);
        return;
    }

    node->makeInternal(bestFeature, bestThreshold);

    std::vector<char> leftMask(n, 0), rightMask(n, 0);

    #pragma omp parallel for schedule(static) if(n > 1000)
    for (size_t i = 0; i < n; ++i) {
        if (!nodeMask[i]) continue;
        if (columnData.at(static_cast<int>(i), bestFeature) <= bestThreshold) {
            leftMask[i] = 1;
        } else {
            rightMask[i] = 1;
        }
    }

    if (depth <= 2 && sampleCount > 5000) {
        #pragma omp parallel sections
        {
            #pragma omp section
            buildXGBNode(node->leftChild.get(), columnData, gradients, hessians, leftMask, featureMask, depth + 1);
            #pragma omp section
            buildXGBNode(node->rightChild.get(), columnData, gradients, hessians, rightMask, featureMask, depth + 1);
        }
    } else {
        buildXGBNode(node->leftChild.get(), columnData, gradients, hessians, leftMask, featureMask, depth + 1);
        buildXGBNode(node->rightChild.get(), columnData, gradients, hessians, rightMask, featureMask, depth + 1);
    }
}

std::tuple<int, double, double> XGBoostClassifier::findBestSplitXGB(
    const ColumnData& columnData,
    const std::vector<double>& gradients,
    const std::vector<double>& hessians,
    const std::vector<char>& nodeMask,
    const std::vector<char>& featureMask,
    double G_parent, double H_parent, int sampleCount) const {

    int bestFeature = -1;
    double bestThreshold = 0.0;
    double bestGain = -std::numeric_limits<double>::infinity();
    constexpr double EPS = 1e-12;

    // Equal gains resolve to the lowest feature index, then the lowest threshold
    auto better = [](double gain, int f, double curGain, int curFeature) {
        return gain > curGain || (gain == curGain && curFeature >= 0 && f < curFeature);
    };

    #pragma omp parallel if(columnData.numFeatures > 4 && sampleCount > 1000)
    {
        int localBestFeature = -1;
        double localBestThreshold = 0.0;
        double localBestGain = -std::numeric_limits<double>::infinity();

        std::vector<int> nodeSorted;
        nodeSorted.reserve(sampleCount);

        #pragma omp for schedule(dynamic) nowait
        for (int f = 0; f < columnData.numFeatures; ++f) {
            if (!featureMask[f]) continue;

            nodeSorted.clear();
            for (const int idx : columnData.sortedIndices[f]) {
                if (nodeMask[idx]) nodeSorted.push_back(idx);
            }
            if (nodeSorted.size() < 2) continue;

            double G_left = 0.0, H_left = 0.0;
            for (size_t i = 0; i + 1 < nodeSorted.size(); ++i) {
                const int idx = nodeSorted[i];
                G_left += gradients[idx];
                H_left += hessians[idx];

                const double currentVal = columnData.at(idx, f);
                const double nextVal = columnData.at(nodeSorted[i + 1], f);
                if (std::abs(nextVal - currentVal) < EPS) continue;

                const double G_right = G_parent - G_left;
                const double H_right = H_parent - H_left;
                if (H_left < config_.minChildWeight || H_right < config_.minChildWeight) continue;

                const double gain = xgbCriterion_.computeSplitGain(
                    G_left, H_left, G_right, H_right, G_parent, H_parent, config_.gamma);

                if (better(gain, f, localBestGain, localBestFeature)) {
                    localBestGain = gain;
                    localBestFeature = f;
                    localBestThreshold = 0.5 * (currentVal + nextVal);
                }
            }
        }

        #pragma omp critical
        {
            if (localBestFeature >= 0 && better(localBestGain, localBestFeature, bestGain, bestFeature)) {
                bestGain = localBestGain;
                bestFeature = localBestFeature;
                bestThreshold = localBestThreshold;
            }
        }
    }

    return {bestFeature, bestThreshold, bestGain};
}

void XGBoostClassifier::checkFitted(int rowLength) const {
    if (!fitted_) {
        throw ConfigurationError("XGBClassifier used before fit");
    }
    if (rowLength != rowLength_) {
        throw ConfigurationError("XGBClassifier was fitted on " + std::to_string(rowLength_) +
                                 " features, got " + std::to_string(rowLength));
    }
}

std::vector<double> XGBoostClassifier::predictProba(const double* sample, int rowLength) const {
    checkFitted(rowLength);
    if (classes_.size() < 2) return {1.0};

    std::vector<double> margin(model_.numGroups());
    std::vector<double> proba(classes_.size());
    model_.predictMargin(sample, margin.data());
    lossFunction_->transform(margin.data(), proba.data());
    return proba;
}

int XGBoostClassifier::predict(const double* sample, int rowLength) const {
    const auto proba = predictProba(sample, rowLength);
    const auto best = std::max_element(proba.begin(), proba.end());
    return classes_[best - proba.begin()];
}

std::vector<int> XGBoostClassifier::predictBatch(const std::vector<double>& X, int rowLength) const {
    checkFitted(rowLength);
    const size_t n = X.size() / rowLength;
    std::vector<int> out(n);

    #pragma omp parallel for schedule(static, 256) if(n > 1000)
    for (size_t i = 0; i < n; ++i) {
        out[i] = predict(&X[i * rowLength], rowLength);
    }
    return out;
}
