#pragma once

#include <vector>

#include "MassFunction.h"

enum class DiscountScheme {
    Classical,    // m'(A) = α m(A), m'(Θ) = α m(Θ) + (1 - α)
    Renormalized  // m'(A) = α m(A), m'(Θ) = m(Θ), then rescaled to sum 1
};

// How an importance weight becomes a discount factor α
enum class WeightScaling {
    Absolute,      // α = w
    RelativeToMax  // α = w / max(w), the most important source is kept intact
};

const char* schemeName(DiscountScheme scheme);
const char* scalingName(WeightScaling scaling);

// Throws std::invalid_argument when alpha is outside [0, 1]
MassFunction discount(const MassFunction& m, double alpha, DiscountScheme scheme = DiscountScheme::Classical);

// Weights must lie in [0, 1] for Absolute scaling and be non-negative
// otherwise; at least one must be positive.
std::vector<double> discountFactors(const std::vector<double>& weights, WeightScaling scaling);

// w_i / sum(w); weights must be non-negative with a positive sum
std::vector<double> normalizeWeights(const std::vector<double>& weights);
