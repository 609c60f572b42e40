#include <gtest/gtest.h>

#include "core/Exceptions.hpp"
#include "evaluation/ScoreLedger.hpp"

namespace {

EvaluationResult resultWithMean(double mean) {
    EvaluationResult r;
    r.meanAccuracy = mean;
    r.predictions = {0, 1, 1};
    return r;
}

} // namespace

TEST(ScoreLedgerTest, KeepsInsertionOrder) {
    ScoreLedger ledger;
    ledger.record("Original", "attack_category", resultWithMean(0.9));
    ledger.record("Original", "target", resultWithMean(0.95));
    ledger.record("SMOTE", "attack_category", resultWithMean(0.8));

    ASSERT_EQ(ledger.size(), 3u);
    const auto& all = ledger.all();
    EXPECT_EQ(all[0].first, ScoreLedger::Key("Original", "attack_category"));
    EXPECT_EQ(all[1].first, ScoreLedger::Key("Original", "target"));
    EXPECT_EQ(all[2].first, ScoreLedger::Key("SMOTE", "attack_category"));
    EXPECT_EQ(all[2].second.strategy, "SMOTE");
    EXPECT_EQ(all[2].second.label, "attack_category");
}

TEST(ScoreLedgerTest, DuplicateKeyIsKeyConflict) {
    ScoreLedger ledger;
    ledger.record("SMOTE", "target", resultWithMean(0.7));
    EXPECT_THROW(ledger.record("SMOTE", "target", resultWithMean(0.71)), KeyConflictError);
    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_DOUBLE_EQ(ledger.find("SMOTE", "target")->meanAccuracy, 0.7);
}

TEST(ScoreLedgerTest, FindReturnsNullForUnknownKey) {
    ScoreLedger ledger;
    ledger.record("ADASYN", "target", resultWithMean(0.5));
    EXPECT_EQ(ledger.find("ADASYN", "attack_category"), nullptr);
    ASSERT_NE(ledger.find("ADASYN", "target"), nullptr);
    EXPECT_EQ(ledger.find("ADASYN", "target")->predictions.size(), 3u);
}
