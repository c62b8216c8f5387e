#include "PairwiseMatrix.h"
#include "../Evidence/EvidenceErrors.h"

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <string>

using namespace std;
using namespace Eigen;

constexpr double PairwiseMatrix::RECIPROCITY_TOLERANCE;

const char* priorityMethodName(PriorityMethod method) {
    switch (method) {
    case PriorityMethod::Eigenvector:   return "Eigenvector";
    case PriorityMethod::GeometricMean: return "GeometricMean";
    }
    return "Unknown";
}

double randomIndex(size_t n) {
    // Saaty (1980), n = 1..15
    static const double RI[] = {0.0, 0.0, 0.58, 0.90, 1.12, 1.24, 1.32, 1.41,
                                1.45, 1.49, 1.51, 1.48, 1.56, 1.57, 1.59};
    if (n == 0) {
        return 0.0;
    }
    return RI[min<size_t>(n, 15) - 1];
}

static string cell(Index i, Index j) {
    return "(" + to_string(i + 1) + ", " + to_string(j + 1) + ")";
}

PairwiseMatrix::PairwiseMatrix(const MatrixXd& values) {
    // Input checks
    if (values.rows() == 0 || values.rows() != values.cols()) {
        throw MalformedMatrixError("Pairwise comparison matrix must be square and non-empty (got " +
                                   to_string(values.rows()) + "x" + to_string(values.cols()) + ").");
    }
    const Index n = values.rows();
    for (Index i = 0; i < n; ++i) {
        for (Index j = 0; j < n; ++j) {
            double a = values(i, j);
            if (!std::isfinite(a) || a <= 0) {
                throw MalformedMatrixError("Entry " + cell(i, j) + " must be a positive number (got " +
                                           to_string(a) + ").");
            }
        }
        if (abs(values(i, i) - 1) > RECIPROCITY_TOLERANCE) {
            throw MalformedMatrixError("Diagonal entry " + cell(i, i) + " must be 1 (got " +
                                       to_string(values(i, i)) + ").");
        }
    }
    for (Index i = 0; i < n; ++i) {
        for (Index j = i + 1; j < n; ++j) {
            if (abs(values(i, j) * values(j, i) - 1) > RECIPROCITY_TOLERANCE) {
                throw MalformedMatrixError("Entries " + cell(i, j) + " and " + cell(j, i) +
                                           " are not reciprocal (" + to_string(values(i, j)) + " * " +
                                           to_string(values(j, i)) + " != 1).");
            }
        }
    }
    values_ = values;
}

PairwiseMatrix PairwiseMatrix::fromWeights(const VectorXd& weights) {
    if (weights.size() == 0 || (weights.array() <= 0).any()) {
        throw MalformedMatrixError("Weights for a pairwise comparison matrix must be positive.");
    }
    const Index n = weights.size();
    MatrixXd a(n, n);
    for (Index i = 0; i < n; ++i) {
        for (Index j = 0; j < n; ++j) {
            a(i, j) = i == j ? 1.0 : weights(i) / weights(j);
        }
    }
    return PairwiseMatrix(a);
}

PriorityAnalysis PairwiseMatrix::priorities(PriorityMethod method) const {
    const Index n = values_.rows();
    PriorityAnalysis result;

    if (method == PriorityMethod::Eigenvector) {
        EigenSolver<MatrixXd> solver(values_);
        if (solver.info() != Success) {
            throw MalformedMatrixError("Eigen decomposition of the pairwise comparison matrix failed.");
        }
        // Perron root: the eigenvalue with the largest real part
        Index k = 0;
        solver.eigenvalues().real().maxCoeff(&k);
        result.lambdaMax = solver.eigenvalues()(k).real();
        VectorXd v = solver.eigenvectors().col(k).real().cwiseAbs();
        result.priorities = v / v.sum();
    } else {
        VectorXd g(n);
        for (Index i = 0; i < n; ++i) {
            g(i) = exp(values_.row(i).array().log().mean());
        }
        result.priorities = g / g.sum();
        VectorXd aw = values_ * result.priorities;
        result.lambdaMax = (aw.array() / result.priorities.array()).mean();
    }

    if (n <= 1) {
        result.consistencyIndex = 0.0;
        result.consistencyRatio = 0.0;
        return result;
    }
    result.consistencyIndex = max(0.0, (result.lambdaMax - n) / (n - 1));
    result.consistencyRatio = n <= 2 ? 0.0 : result.consistencyIndex / randomIndex(static_cast<size_t>(n));
    return result;
}
