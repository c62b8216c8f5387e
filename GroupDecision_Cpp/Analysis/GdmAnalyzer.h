#pragma once

#include "AnalysisConfig.h"
#include "AnalysisResult.h"
#include "DecisionProblem.h"

// Group decision analysis (DS/AHP-GDM):
//  1. one BPA per (expert, criterion) from the expert's judgment
//  2. each BPA discounted by the expert's importance
//  3. per criterion, experts folded left to right in input order
//  4. each criterion BPA discounted by its normalized weight
//  5. criteria folded left to right in input order into the group BPA
//  6. belief/plausibility intervals and ranking of the alternatives
// The fold order is part of the result: the adaptive rule is not associative.
class GdmAnalyzer {
public:
    // Throws std::invalid_argument for an invalid configuration
    explicit GdmAnalyzer(const AnalysisConfig& config = AnalysisConfig());

    const AnalysisConfig& config() const { return config_; }

    // Judgment errors are rethrown with the expert and criterion ids.
    // Nothing is returned when any step fails.
    AnalysisResult run(const DecisionProblem& problem) const;

private:
    AnalysisConfig config_;
};
