#include "core/Types.hpp"
#include <algorithm>
#include <limits>

std::vector<size_t> LabelVector::classCounts() const {
    std::vector<size_t> counts(classes.size(), 0);
    for (int c : codes) {
        if (c >= 0 && c < static_cast<int>(counts.size())) {
            ++counts[c];
        }
    }
    return counts;
}

std::vector<std::pair<std::string, size_t>> LabelVector::valueCounts() const {
    const auto counts = classCounts();
    std::vector<int> order;
    order.reserve(counts.size());
    for (int c = 0; c < static_cast<int>(counts.size()); ++c) {
        if (counts[c] > 0) order.push_back(c);
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](int a, int b) { return counts[a] > counts[b]; });

    std::vector<std::pair<std::string, size_t>> result;
    result.reserve(order.size());
    for (int c : order) {
        result.emplace_back(classes[c], counts[c]);
    }
    return result;
}

double imbalanceRatio(const LabelVector& labels) {
    size_t maxCount = 0;
    size_t minCount = std::numeric_limits<size_t>::max();
    for (size_t count : labels.classCounts()) {
        if (count == 0) continue;
        maxCount = std::max(maxCount, count);
        minCount = std::min(minCount, count);
    }
    if (maxCount == 0) return 1.0;
    return static_cast<double>(maxCount) / static_cast<double>(minCount);
}
