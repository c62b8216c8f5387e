#pragma once

#include "../Evidence/Frame.h"
#include "../Evidence/MassFunction.h"
#include "Judgment.h"
#include "PairwiseMatrix.h"

// How the priority vector of a pairwise matrix is turned into masses
enum class MassAllocation {
    FixedConfidence,   // m({a_i}) = κ w_i, m(Θ) = 1 - κ
    ConsistencyScaled  // same with κ (1 - CR)
};

enum class ConsistencyPolicy {
    Reject,  // throw InconsistentJudgmentError
    Warn     // build anyway and report consistent = false
};

const char* allocationName(MassAllocation allocation);

struct BpaBuilderOptions {
    PriorityMethod priorityMethod = PriorityMethod::Eigenvector;
    double consistencyThreshold = 0.1;
    ConsistencyPolicy consistencyPolicy = ConsistencyPolicy::Reject;
    MassAllocation allocation = MassAllocation::FixedConfidence;
    double confidence = 0.8;  // κ
};

struct BuiltBpa {
    MassFunction bpa;
    PriorityAnalysis priorities;  // empty for group judgments
    bool consistent;
};

// Converts one expert's judgment on one criterion into a BPA over the frame
class BpaBuilder {
public:
    explicit BpaBuilder(const Frame& frame, const BpaBuilderOptions& options = BpaBuilderOptions());

    const BpaBuilderOptions& options() const { return options_; }

    // Throws MalformedMatrixError, or InconsistentJudgmentError under Reject
    BuiltBpa fromMatrix(const Eigen::MatrixXd& matrix) const;
    BuiltBpa fromMatrix(const PairwiseMatrix& matrix) const;

    // m(s_j) = a_j p / (Σ a p + √d), m(Θ) = √d / (Σ a p + √d).
    // Throws MalformedJudgmentError.
    MassFunction fromGroups(const GroupJudgment& judgment) const;

    BuiltBpa build(const Judgment& judgment) const;

private:
    Frame frame_;
    BpaBuilderOptions options_;
};
