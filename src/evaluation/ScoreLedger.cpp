#include "evaluation/ScoreLedger.hpp"
#include "core/Exceptions.hpp"

void ScoreLedger::record(const std::string& strategy, const std::string& label, EvaluationResult result) {
    if (find(strategy, label) != nullptr) {
        throw KeyConflictError("(" + strategy + ", " + label + ") is already recorded");
    }
    result.strategy = strategy;
    result.label = label;
    entries_.emplace_back(Key(strategy, label), std::move(result));
}

const EvaluationResult* ScoreLedger::find(const std::string& strategy, const std::string& label) const {
    for (const auto& entry : entries_) {
        if (entry.first.first == strategy && entry.first.second == label) return &entry.second;
    }
    return nullptr;
}
