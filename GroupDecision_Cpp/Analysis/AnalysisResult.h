#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "../Evidence/BeliefPlausibility.h"
#include "../Evidence/Combination.h"
#include "../Evidence/Frame.h"
#include "../Evidence/MassFunction.h"
#include "../Judgment/Judgment.h"
#include "../Judgment/PairwiseMatrix.h"

// BPA of one expert on one criterion, before and after discounting
struct JudgmentTrace {
    std::string expert;
    std::string criterion;
    bool provided;                // false: no judgment given, vacuous BPA used
    JudgmentKind kind;            // meaningful only when provided
    PriorityAnalysis priorities;  // pairwise judgments only
    bool consistent;
    double discountFactor;        // α of the expert
    MassFunction bpa;
    MassFunction discounted;
};

// Experts folded together for one criterion
struct CriterionTrace {
    std::string criterion;
    double weight;          // normalized
    double discountFactor;  // α derived from the normalized weight
    double averageConflict; // mean pairwise K among the discounted expert BPAs
    std::vector<FoldStep> steps;
    MassFunction combined;
    MassFunction discounted;
};

struct AnalysisResult {
    Frame frame;
    std::vector<JudgmentTrace> judgments;  // criterion by criterion, experts in input order
    std::vector<CriterionTrace> criteria;
    std::vector<FoldStep> groupSteps;      // fold across criteria
    MassFunction groupBpa;
    std::vector<AlternativeAssessment> ranking;
    std::vector<std::string> warnings;

    const std::string& optimal() const { return ranking.front().alternative; }
    const AlternativeAssessment& assessment(const std::string& alternative) const;

    // Every fold step: per-criterion folds in order, then the cross-criteria fold
    std::vector<FoldStep> allSteps() const;
    std::size_t ruleCount(CombinationRule rule) const;

    void printReport(std::ostream& out) const;
};
