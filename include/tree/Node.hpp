#pragma once

#include <memory>
#include <cstddef>

/**
 * Binary regression-tree node. Internal nodes route on
 * sample[featureIndex] <= threshold; leaves carry the additive weight.
 */
struct Node {
    bool   isLeaf  = false;
    size_t samples = 0;
    double cover   = 0.0;      // Hessian sum of the rows reaching the node

    int    featureIndex = -1;
    double threshold    = 0.0;
    double weight       = 0.0;

    std::unique_ptr<Node> leftChild;
    std::unique_ptr<Node> rightChild;

    void makeLeaf(double leafWeight) {
        isLeaf = true;
        weight = leafWeight;
        featureIndex = -1;
        leftChild.reset();
        rightChild.reset();
    }

    void makeInternal(int feature, double splitValue) {
        isLeaf = false;
        featureIndex = feature;
        threshold = splitValue;
        leftChild = std::make_unique<Node>();
        rightChild = std::make_unique<Node>();
    }

    int getFeatureIndex() const { return isLeaf ? -1 : featureIndex; }
    double getThreshold() const { return isLeaf ? 0.0 : threshold; }
    double getPrediction() const { return isLeaf ? weight : 0.0; }

    const Node* getLeft() const { return isLeaf ? nullptr : leftChild.get(); }
    const Node* getRight() const { return isLeaf ? nullptr : rightChild.get(); }

    // Leaf reached by a row
    const Node* route(const double* sample) const {
        const Node* cur = this;
        while (cur && !cur->isLeaf) {
            cur = (sample[cur->featureIndex] <= cur->threshold) ? cur->leftChild.get()
                                                                : cur->rightChild.get();
        }
        return cur;
    }

    int depth() const {
        if (isLeaf) return 0;
        int l = leftChild ? leftChild->depth() : 0;
        int r = rightChild ? rightChild->depth() : 0;
        return 1 + (l > r ? l : r);
    }
};
