#pragma once

#include <Eigen/Dense>

enum class PriorityMethod {
    Eigenvector,   // principal right eigenvector
    GeometricMean  // normalized geometric means of the rows
};

const char* priorityMethodName(PriorityMethod method);

// Priority vector of a pairwise comparison matrix with its consistency
struct PriorityAnalysis {
    Eigen::VectorXd priorities;  // positive, sums to 1
    double lambdaMax;
    double consistencyIndex;     // (lambdaMax - n) / (n - 1)
    double consistencyRatio;     // consistencyIndex / RI(n)
};

// Saaty's random consistency index; RI(n) = RI(15) for n > 15
double randomIndex(std::size_t n);

// Square, positive and reciprocal matrix of preference ratios with unit diagonal
class PairwiseMatrix {
public:
    static constexpr double RECIPROCITY_TOLERANCE = 1e-6;

    // Throws MalformedMatrixError
    explicit PairwiseMatrix(const Eigen::MatrixXd& values);

    // a_ij = w_i / w_j, a perfectly consistent matrix
    static PairwiseMatrix fromWeights(const Eigen::VectorXd& weights);

    std::size_t size() const { return static_cast<std::size_t>(values_.rows()); }
    const Eigen::MatrixXd& values() const { return values_; }

    PriorityAnalysis priorities(PriorityMethod method = PriorityMethod::Eigenvector) const;

private:
    Eigen::MatrixXd values_;
};
