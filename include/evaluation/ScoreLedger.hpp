#pragma once

#include <string>
#include <utility>
#include <vector>

// Scores of one (strategy, label) iteration
struct EvaluationResult {
    std::string strategy;
    std::string label;
    double meanAccuracy = 0.0;
    double stdAccuracy = 0.0;
    std::vector<int> predictions;     // out-of-fold, aligned with the resampled labels
    std::vector<double> foldScores;
    std::vector<std::pair<std::string, size_t>> resampledCounts;
};

/**
 * Insertion-ordered record of every evaluation in a run, keyed by
 * (strategy, label). Each key can be written once.
 */
class ScoreLedger {
public:
    using Key = std::pair<std::string, std::string>;
    using Entry = std::pair<Key, EvaluationResult>;

    /** @throws KeyConflictError when the key was already recorded */
    void record(const std::string& strategy, const std::string& label, EvaluationResult result);

    const std::vector<Entry>& all() const { return entries_; }

    // nullptr when absent
    const EvaluationResult* find(const std::string& strategy, const std::string& label) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};
