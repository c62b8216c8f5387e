#include "Combination.h"
#include "EvidenceErrors.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

using namespace std;
using namespace Eigen;

const char* ruleName(CombinationRule rule) {
    switch (rule) {
    case CombinationRule::Dempster: return "Dempster";
    case CombinationRule::Yager:    return "Yager";
    case CombinationRule::Adaptive: return "Adaptive";
    }
    return "Unknown";
}

static void checkSameFrame(const MassFunction& m1, const MassFunction& m2) {
    if (m1.frameSize() != m2.frameSize()) {
        throw invalid_argument("Both mass functions must be defined on the same frame (sizes " +
                               to_string(m1.frameSize()) + " and " + to_string(m2.frameSize()) + ").");
    }
}

// Accumulates m1(A) * m2(B) on every non-empty A ∩ B and returns the mass
// that fell on the empty set (the conflict K).
static double intersectAll(const MassFunction& m1, const MassFunction& m2, map<FocalSet, double>& products) {
    checkSameFrame(m1, m2);
    const vector<FocalSet>& f1 = m1.focalElements();
    const vector<FocalSet>& f2 = m2.focalElements();
    const VectorXd& v1 = m1.masses();
    const VectorXd& v2 = m2.masses();

    double conflict = 0.0;
    for (size_t i = 0; i < f1.size(); ++i) {
        for (size_t j = 0; j < f2.size(); ++j) {
            double product = v1(static_cast<Index>(i)) * v2(static_cast<Index>(j));
            FocalSet c = intersect(f1[i], f2[j]);
            if (c == EMPTY_SET) {
                conflict += product;
            } else {
                products[c] += product;
            }
        }
    }
    return conflict;
}

static bool isTotalConflict(double conflict) {
    return conflict >= TOTAL_CONFLICT_LEVEL;
}

double conflictDegree(const MassFunction& m1, const MassFunction& m2) {
    checkSameFrame(m1, m2);
    const vector<FocalSet>& f1 = m1.focalElements();
    const vector<FocalSet>& f2 = m2.focalElements();

    double conflict = 0.0;
    for (size_t i = 0; i < f1.size(); ++i) {
        for (size_t j = 0; j < f2.size(); ++j) {
            if (intersect(f1[i], f2[j]) == EMPTY_SET) {
                conflict += m1.masses()(static_cast<Index>(i)) * m2.masses()(static_cast<Index>(j));
            }
        }
    }
    return min(max(conflict, 0.0), 1.0);
}

double averagePairwiseConflict(const vector<MassFunction>& bpas) {
    if (bpas.size() < 2) {
        return 0.0;
    }
    double total = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i < bpas.size(); ++i) {
        for (size_t j = i + 1; j < bpas.size(); ++j) {
            total += conflictDegree(bpas[i], bpas[j]);
            ++pairs;
        }
    }
    return total / static_cast<double>(pairs);
}

MassFunction combineConjunctive(const MassFunction& m1, const MassFunction& m2) {
    map<FocalSet, double> products;
    double conflict = intersectAll(m1, m2, products);
    if (conflict > 0.0) {
        products[EMPTY_SET] = conflict;
    }
    return MassFunction(m1.frameSize(), products, false);
}

MassFunction combineDempster(const MassFunction& m1, const MassFunction& m2) {
    map<FocalSet, double> products;
    double conflict = intersectAll(m1, m2, products);
    if (isTotalConflict(conflict) || products.empty()) {
        throw TotalConflictError(conflict);
    }

    // Normalizing by the mass that survived (= 1 - K) keeps the sum exact
    double kept = 0.0;
    for (const auto& entry : products) {
        kept += entry.second;
    }
    for (auto& entry : products) {
        entry.second /= kept;
    }
    return MassFunction(m1.frameSize(), products);
}

MassFunction combineYager(const MassFunction& m1, const MassFunction& m2) {
    map<FocalSet, double> products;
    double conflict = intersectAll(m1, m2, products);
    products[m1.theta()] += conflict;
    return MassFunction(m1.frameSize(), products);
}

AdaptiveCombiner::AdaptiveCombiner(double threshold, CombinationRule rule)
    : threshold_(threshold), rule_(rule) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw invalid_argument("Conflict threshold must lie in [0, 1] (got " + to_string(threshold) + ").");
    }
}

CombinationRule AdaptiveCombiner::select(double conflict) const {
    if (rule_ != CombinationRule::Adaptive) {
        return rule_;
    }
    if (conflict < threshold_ && !isTotalConflict(conflict)) {
        return CombinationRule::Dempster;
    }
    return CombinationRule::Yager;
}

CombinationOutcome AdaptiveCombiner::combine(const MassFunction& m1, const MassFunction& m2) const {
    double conflict = conflictDegree(m1, m2);
    CombinationRule applied = select(conflict);
    if (applied == CombinationRule::Dempster) {
        return CombinationOutcome{combineDempster(m1, m2), conflict, applied};
    }
    return CombinationOutcome{combineYager(m1, m2), conflict, applied};
}

MassFunction AdaptiveCombiner::fold(const vector<MassFunction>& bpas,
                                    const vector<string>& labels,
                                    const string& stage,
                                    vector<FoldStep>& steps) const {
    if (bpas.empty()) {
        throw invalid_argument("Nothing to combine for " + stage + ".");
    }
    if (!labels.empty() && labels.size() != bpas.size()) {
        throw invalid_argument("Expected one label per source for " + stage + ".");
    }

    MassFunction running = bpas[0];
    for (size_t i = 1; i < bpas.size(); ++i) {
        CombinationOutcome outcome = combine(running, bpas[i]);
        running = outcome.result;

        FoldStep s;
        s.stage = stage;
        s.step = i;
        s.source = labels.empty() ? "source " + to_string(i + 1) : labels[i];
        s.conflict = outcome.conflict;
        s.threshold = threshold_;
        s.applied = outcome.applied;
        s.focalCount = running.size();
        steps.push_back(s);
    }
    return running;
}
