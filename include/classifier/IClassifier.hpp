#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * Multi-class classifier over a row-major feature buffer. Labels are
 * arbitrary integer codes; predict returns codes seen during fit.
 */
class IClassifier {
public:
    virtual ~IClassifier() = default;

    virtual void fit(const std::vector<double>& X, int rowLength, const std::vector<int>& labels) = 0;

    virtual int predict(const double* sample, int rowLength) const = 0;

    virtual std::vector<int> predictBatch(const std::vector<double>& X, int rowLength) const {
        const size_t n = rowLength > 0 ? X.size() / rowLength : 0;
        std::vector<int> out(n);
        for (size_t i = 0; i < n; ++i) out[i] = predict(&X[i * rowLength], rowLength);
        return out;
    }

    virtual std::string name() const = 0;
    // Abbreviation used in plot and ledger labels
    virtual std::string shortName() const = 0;
};

// Produces a fresh, unfitted classifier for every fold
using ClassifierFactory = std::function<std::unique_ptr<IClassifier>()>;
