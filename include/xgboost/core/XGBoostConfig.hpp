#pragma once

#include <cstdint>
#include <string>

struct XGBoostConfig {
    // Basic parameters
    int numRounds = 100;
    double eta = 0.1;
    int maxDepth = 3;
    double minChildWeight = 1.0;

    // Regularization parameters
    double lambda = 1.0;
    double gamma = 0.0;
    double alpha = 0.0;

    // Sampling parameters
    double subsample = 1.0;
    double colsampleByTree = 1.0;
    uint32_t seed = 20;

    // Training control
    bool verbose = false;

    // "auto" picks binary:logistic for two classes, multi:softprob otherwise
    std::string objective = "auto";
};
