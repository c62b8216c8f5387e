#include "Discounting.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>

using namespace std;

const char* schemeName(DiscountScheme scheme) {
    switch (scheme) {
    case DiscountScheme::Classical:    return "Classical";
    case DiscountScheme::Renormalized: return "Renormalized";
    }
    return "Unknown";
}

const char* scalingName(WeightScaling scaling) {
    switch (scaling) {
    case WeightScaling::Absolute:      return "Absolute";
    case WeightScaling::RelativeToMax: return "RelativeToMax";
    }
    return "Unknown";
}

MassFunction discount(const MassFunction& m, double alpha, DiscountScheme scheme) {
    if (!(alpha >= 0.0 && alpha <= 1.0)) {
        throw invalid_argument("Discount factor must lie in [0, 1] (got " + to_string(alpha) + ").");
    }
    if (alpha == 1.0) {
        return m;
    }

    const FocalSet theta = m.theta();
    map<FocalSet, double> scaled;
    double thetaMass = 0.0;
    for (size_t i = 0; i < m.size(); ++i) {
        FocalSet a = m.focalElements()[i];
        double mass = m.masses()(static_cast<Eigen::Index>(i));
        if (a == theta) {
            thetaMass = mass;
        } else {
            scaled[a] = alpha * mass;
        }
    }

    if (scheme == DiscountScheme::Classical) {
        scaled[theta] = alpha * thetaMass + (1.0 - alpha);
        return MassFunction(m.frameSize(), scaled, m.isNormalized());
    }

    // Beynon: Θ keeps its mass, the committed part shrinks, then rescale
    double total = thetaMass;
    for (const auto& entry : scaled) {
        total += entry.second;
    }
    if (total <= 0.0) {
        return MassFunction::vacuous(m.frameSize());
    }
    for (auto& entry : scaled) {
        entry.second /= total;
    }
    scaled[theta] = thetaMass / total;
    return MassFunction(m.frameSize(), scaled, m.isNormalized());
}

vector<double> normalizeWeights(const vector<double>& weights) {
    double total = 0.0;
    for (double w : weights) {
        if (!(w >= 0.0) || !std::isfinite(w)) {
            throw invalid_argument("Weights must be finite and non-negative (got " + to_string(w) + ").");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw invalid_argument("At least one weight must be positive.");
    }
    vector<double> normalized(weights.size());
    for (size_t i = 0; i < weights.size(); ++i) {
        normalized[i] = weights[i] / total;
    }
    return normalized;
}

vector<double> discountFactors(const vector<double>& weights, WeightScaling scaling) {
    if (weights.empty()) {
        return vector<double>();
    }
    double maxWeight = 0.0;
    for (double w : weights) {
        if (!(w >= 0.0) || !std::isfinite(w)) {
            throw invalid_argument("Weights must be finite and non-negative (got " + to_string(w) + ").");
        }
        if (scaling == WeightScaling::Absolute && w > 1.0) {
            throw invalid_argument("Absolute weights must lie in [0, 1] (got " + to_string(w) + ").");
        }
        maxWeight = max(maxWeight, w);
    }
    if (maxWeight == 0.0) {
        throw invalid_argument("At least one weight must be positive.");
    }

    vector<double> factors(weights.size());
    for (size_t i = 0; i < weights.size(); ++i) {
        factors[i] = scaling == WeightScaling::RelativeToMax ? weights[i] / maxWeight : weights[i];
    }
    return factors;
}
