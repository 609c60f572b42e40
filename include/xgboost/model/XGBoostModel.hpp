#pragma once

#include "tree/Node.hpp"
#include <vector>
#include <memory>

/**
 * Boosted ensemble with one tree per output group per round. Group g of a
 * row's margin is baseScore + sum of eta * leaf weight over group g trees.
 */
class XGBoostModel {
public:
    struct XGBTree {
        std::unique_ptr<Node> tree;
        double weight;
        int group;

        XGBTree(std::unique_ptr<Node> t, double w, int g)
            : tree(std::move(t)), weight(w), group(g) {}
    };

    XGBoostModel() = default;

    void reset(int numGroups, double baseScore) {
        trees_.clear();
        numGroups_ = numGroups;
        baseScore_ = baseScore;
    }

    void addTree(std::unique_ptr<Node> tree, double weight, int group) {
        trees_.emplace_back(std::move(tree), weight, group);
    }

    // Writes numGroups() margins for one row
    void predictMargin(const double* sample, double* margin) const {
        for (int g = 0; g < numGroups_; ++g) margin[g] = baseScore_;
        for (const auto& t : trees_) {
            const Node* leaf = t.tree->route(sample);
            if (leaf) margin[t.group] += t.weight * leaf->getPrediction();
        }
    }

    // Row-major n * numGroups() margins
    std::vector<double> predictMarginBatch(const std::vector<double>& X, int rowLength) const {
        const size_t n = rowLength > 0 ? X.size() / rowLength : 0;
        std::vector<double> margins(n * numGroups_);

        #pragma omp parallel for schedule(static, 256) if(n > 1000)
        for (size_t i = 0; i < n; ++i) {
            predictMargin(&X[i * rowLength], &margins[i * numGroups_]);
        }
        return margins;
    }

    size_t getTreeCount() const { return trees_.size(); }
    int numGroups() const { return numGroups_; }
    double getBaseScore() const { return baseScore_; }

    // Split counts per feature, normalized to sum to one
    std::vector<double> getFeatureImportance(int numFeatures) const {
        std::vector<double> importance(numFeatures, 0.0);
        for (const auto& t : trees_) addTreeImportance(t.tree.get(), importance);

        double total = 0.0;
        for (double imp : importance) total += imp;
        if (total > 0) {
            for (double& imp : importance) imp /= total;
        }
        return importance;
    }

private:
    std::vector<XGBTree> trees_;
    int numGroups_ = 1;
    double baseScore_ = 0.0;

    void addTreeImportance(const Node* node, std::vector<double>& importance) const {
        if (!node || node->isLeaf) return;
        const int feature = node->getFeatureIndex();
        if (feature >= 0 && feature < static_cast<int>(importance.size())) {
            importance[feature] += 1.0;
        }
        addTreeImportance(node->getLeft(), importance);
        addTreeImportance(node->getRight(), importance);
    }
};
