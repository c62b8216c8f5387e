#pragma once

#include <stdexcept>
#include <string>

// Bad or unusable judgment of one expert on one criterion.
// Expert and criterion ids are empty when raised outside an analysis run.
class JudgmentError : public std::invalid_argument {
public:
    JudgmentError(const std::string& detail, const std::string& expert = "", const std::string& criterion = "")
        : std::invalid_argument(compose(detail, expert, criterion)),
          detail_(detail), expert_(expert), criterion_(criterion) {}

    const std::string& detail() const { return detail_; }
    const std::string& expert() const { return expert_; }
    const std::string& criterion() const { return criterion_; }

private:
    static std::string compose(const std::string& detail, const std::string& expert, const std::string& criterion) {
        if (expert.empty() && criterion.empty()) {
            return detail;
        }
        return "expert '" + expert + "', criterion '" + criterion + "': " + detail;
    }

    std::string detail_;
    std::string expert_;
    std::string criterion_;
};

class MalformedJudgmentError : public JudgmentError {
public:
    using JudgmentError::JudgmentError;
};

// Pairwise comparison matrix is not square, positive and reciprocal
class MalformedMatrixError : public MalformedJudgmentError {
public:
    using MalformedJudgmentError::MalformedJudgmentError;
};

// Consistency ratio of a pairwise comparison matrix is above the accepted threshold
class InconsistentJudgmentError : public JudgmentError {
public:
    InconsistentJudgmentError(double consistencyRatio, double threshold,
                              const std::string& expert = "", const std::string& criterion = "")
        : JudgmentError("consistency ratio " + std::to_string(consistencyRatio) +
                        " exceeds the threshold " + std::to_string(threshold), expert, criterion),
          consistencyRatio_(consistencyRatio), threshold_(threshold) {}

    double consistencyRatio() const { return consistencyRatio_; }
    double threshold() const { return threshold_; }

private:
    double consistencyRatio_;
    double threshold_;
};

// Mass assignment broke the sum-to-one or range invariant
class InvalidBPAError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Normalized combination requested on totally conflicting evidence (K = 1)
class TotalConflictError : public std::domain_error {
public:
    explicit TotalConflictError(double conflict)
        : std::domain_error("Dempster's rule is undefined for total conflict (K = " + std::to_string(conflict) + ")."),
          conflict_(conflict) {}

    double conflict() const { return conflict_; }

private:
    double conflict_;
};
