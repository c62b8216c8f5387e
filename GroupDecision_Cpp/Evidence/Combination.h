#pragma once

#include <string>
#include <vector>

#include "MassFunction.h"

enum class CombinationRule {
    Dempster,  // conjunctive, normalized by 1 - K
    Yager,     // conjunctive, conflict K moved to Θ
    Adaptive   // Dempster while K < threshold, Yager otherwise
};

const char* ruleName(CombinationRule rule);

// Conflict at or above this level is treated as total (K = 1)
const double TOTAL_CONFLICT_LEVEL = 1.0 - 1e-10;
const double DEFAULT_CONFLICT_THRESHOLD = 0.4;

struct CombinationOutcome {
    MassFunction result;
    double conflict;
    CombinationRule applied;
};

// One pairwise step of a left-to-right fold
struct FoldStep {
    std::string stage;       // what the fold produces, e.g. "criterion Price"
    std::size_t step;        // 1-based position in the fold
    std::string source;      // label of the operand folded into the running result
    double conflict;         // K between the running result and the source
    double threshold;
    CombinationRule applied;
    std::size_t focalCount;  // focal elements of the new running result
};

// K = sum of m1(A) * m2(B) over A ∩ B = ∅
double conflictDegree(const MassFunction& m1, const MassFunction& m2);

// Mean K over all unordered pairs; 0 for fewer than two sources
double averagePairwiseConflict(const std::vector<MassFunction>& bpas);

// Unnormalized conjunctive combination: K stays on the empty set
MassFunction combineConjunctive(const MassFunction& m1, const MassFunction& m2);
// Throws TotalConflictError when K = 1
MassFunction combineDempster(const MassFunction& m1, const MassFunction& m2);
MassFunction combineYager(const MassFunction& m1, const MassFunction& m2);

// Applies the configured rule, choosing per step in adaptive mode
class AdaptiveCombiner {
public:
    explicit AdaptiveCombiner(double threshold = DEFAULT_CONFLICT_THRESHOLD,
                              CombinationRule rule = CombinationRule::Adaptive);

    double threshold() const { return threshold_; }
    CombinationRule rule() const { return rule_; }

    // Rule that combine() applies for a given conflict
    CombinationRule select(double conflict) const;

    CombinationOutcome combine(const MassFunction& m1, const MassFunction& m2) const;

    // Left-to-right fold: ((b0 ⊕ b1) ⊕ b2) ⊕ ... with the rule re-selected at
    // every step against the running result. Appends one FoldStep per step.
    // labels may be empty, otherwise one per source.
    MassFunction fold(const std::vector<MassFunction>& bpas,
                      const std::vector<std::string>& labels,
                      const std::string& stage,
                      std::vector<FoldStep>& steps) const;

private:
    double threshold_;
    CombinationRule rule_;
};
