#include "BpaBuilder.h"
#include "../Evidence/EvidenceErrors.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>

using namespace std;
using namespace Eigen;

const char* allocationName(MassAllocation allocation) {
    switch (allocation) {
    case MassAllocation::FixedConfidence:   return "FixedConfidence";
    case MassAllocation::ConsistencyScaled: return "ConsistencyScaled";
    }
    return "Unknown";
}

BpaBuilder::BpaBuilder(const Frame& frame, const BpaBuilderOptions& options)
    : frame_(frame), options_(options) {
    if (!(options.confidence >= 0.0 && options.confidence <= 1.0)) {
        throw invalid_argument("Confidence factor must lie in [0, 1] (got " + to_string(options.confidence) + ").");
    }
    if (!(options.consistencyThreshold >= 0.0)) {
        throw invalid_argument("Consistency threshold must be non-negative (got " +
                               to_string(options.consistencyThreshold) + ").");
    }
}

BuiltBpa BpaBuilder::fromMatrix(const MatrixXd& matrix) const {
    if (static_cast<size_t>(matrix.rows()) != frame_.size() || static_cast<size_t>(matrix.cols()) != frame_.size()) {
        throw MalformedMatrixError("Pairwise comparison matrix is " + to_string(matrix.rows()) + "x" +
                                   to_string(matrix.cols()) + " but the frame has " +
                                   to_string(frame_.size()) + " alternatives.");
    }
    return fromMatrix(PairwiseMatrix(matrix));
}

BuiltBpa BpaBuilder::fromMatrix(const PairwiseMatrix& matrix) const {
    if (matrix.size() != frame_.size()) {
        throw MalformedMatrixError("Pairwise comparison matrix has dimension " + to_string(matrix.size()) +
                                   " but the frame has " + to_string(frame_.size()) + " alternatives.");
    }

    PriorityAnalysis analysis = matrix.priorities(options_.priorityMethod);
    bool consistent = analysis.consistencyRatio <= options_.consistencyThreshold;
    if (!consistent && options_.consistencyPolicy == ConsistencyPolicy::Reject) {
        throw InconsistentJudgmentError(analysis.consistencyRatio, options_.consistencyThreshold);
    }

    double kappa = options_.confidence;
    if (options_.allocation == MassAllocation::ConsistencyScaled) {
        kappa *= max(0.0, 1.0 - analysis.consistencyRatio);
    }

    map<FocalSet, double> masses;
    for (size_t i = 0; i < frame_.size(); ++i) {
        masses[frame_.singleton(i)] += kappa * analysis.priorities(static_cast<Index>(i));
    }
    masses[frame_.theta()] += 1.0 - kappa;

    return BuiltBpa{MassFunction(frame_.size(), masses), analysis, consistent};
}

MassFunction BpaBuilder::fromGroups(const GroupJudgment& judgment) const {
    const double p = judgment.priorityValue;
    if (!(p >= 0.0 && p <= 1.0)) {
        throw MalformedJudgmentError("Criterion priority value must lie in [0, 1] (got " + to_string(p) + ").");
    }
    if (p == 0.0 || judgment.groups.empty()) {
        return MassFunction::vacuous(frame_.size());
    }

    vector<FocalSet> sets;
    FocalSet covered = EMPTY_SET;
    double weighted = 0.0;
    for (const auto& group : judgment.groups) {
        if (group.alternatives.empty()) {
            throw MalformedJudgmentError("A group of alternatives must not be empty.");
        }
        if (!std::isfinite(group.preference) || group.preference <= 0) {
            throw MalformedJudgmentError("Group preference values must be positive (got " +
                                         to_string(group.preference) + ").");
        }
        FocalSet s = EMPTY_SET;
        for (const auto& id : group.alternatives) {
            if (!frame_.contains(id)) {
                throw MalformedJudgmentError("Unknown alternative '" + id + "' in a group judgment.");
            }
            s |= frame_.singleton(id);
        }
        if (intersect(s, covered) != EMPTY_SET) {
            throw MalformedJudgmentError("Groups must be disjoint; " + frame_.label(intersect(s, covered)) +
                                         " appears more than once.");
        }
        covered |= s;
        sets.push_back(s);
        weighted += group.preference * p;
    }

    const double sqrtD = sqrt(static_cast<double>(sets.size()));
    const double denominator = weighted + sqrtD;

    map<FocalSet, double> masses;
    for (size_t j = 0; j < sets.size(); ++j) {
        masses[sets[j]] += judgment.groups[j].preference * p / denominator;
    }
    masses[frame_.theta()] += sqrtD / denominator;
    return MassFunction(frame_.size(), masses);
}

BuiltBpa BpaBuilder::build(const Judgment& judgment) const {
    if (judgment.kind == JudgmentKind::Pairwise) {
        return fromMatrix(judgment.matrix);
    }
    PriorityAnalysis none;
    none.lambdaMax = 0.0;
    none.consistencyIndex = 0.0;
    none.consistencyRatio = 0.0;
    return BuiltBpa{fromGroups(judgment.groups), none, true};
}
