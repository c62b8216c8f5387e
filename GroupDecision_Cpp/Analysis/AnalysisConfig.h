#pragma once

#include <iosfwd>

#include "../Evidence/BeliefPlausibility.h"
#include "../Evidence/Combination.h"
#include "../Evidence/Discounting.h"
#include "../Judgment/BpaBuilder.h"

// Tunables of one analysis run
struct AnalysisConfig {
    CombinationRule rule = CombinationRule::Adaptive;
    double conflictThreshold = DEFAULT_CONFLICT_THRESHOLD;  // τ
    double pessimism = DEFAULT_PESSIMISM;                   // γ in γ Bel + (1 - γ) Pl
    BpaBuilderOptions builder;
    WeightScaling expertScaling = WeightScaling::RelativeToMax;
    WeightScaling criterionScaling = WeightScaling::RelativeToMax;
    DiscountScheme discountScheme = DiscountScheme::Classical;
    std::ostream* log = nullptr;  // progress trace, silent when null

    // Throws std::invalid_argument for out-of-range values
    void validate() const;
};
