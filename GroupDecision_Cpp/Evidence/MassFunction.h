#pragma once

#include <iosfwd>
#include <map>
#include <vector>
#include <Eigen/Dense>

#include "Frame.h"

// Basic probability assignment over the non-empty subsets of a frame.
// Focal elements are kept in canonical (ascending FocalSet) order with their
// masses in a parallel vector. Instances are immutable.
class MassFunction {
public:
    static constexpr double TOLERANCE = 1e-9;

    // Throws InvalidBPAError when the masses leave [0, 1], do not sum to 1,
    // fall outside the frame, or put mass on the empty set of a normalized BPA.
    // Zero masses are dropped.
    MassFunction(std::size_t frameSize, const std::map<FocalSet, double>& masses, bool normalized = true);

    // m(Θ) = 1
    static MassFunction vacuous(std::size_t frameSize);
    // m(A) = 1
    static MassFunction categorical(std::size_t frameSize, FocalSet focal);

    std::size_t frameSize() const { return frameSize_; }
    FocalSet theta() const { return theta_; }
    std::size_t size() const { return focal_.size(); }

    const std::vector<FocalSet>& focalElements() const { return focal_; }
    const Eigen::VectorXd& masses() const { return masses_; }
    std::map<FocalSet, double> toMap() const;

    double mass(FocalSet s) const;
    double totalMass() const { return masses_.sum(); }

    // Unnormalized results keep the conflict on the empty set
    bool isNormalized() const { return normalized_; }
    double massOfEmptySet() const { return mass(EMPTY_SET); }
    bool isVacuous() const;

    // Sum of the masses of the non-empty subsets of query
    double belief(FocalSet query) const;
    // Sum of the masses of the focal elements intersecting query
    double plausibility(FocalSet query) const;

    bool approxEquals(const MassFunction& other, double tolerance = TOLERANCE) const;

    void print(std::ostream& out, const Frame& frame) const;

private:
    std::size_t frameSize_;
    FocalSet theta_;
    std::vector<FocalSet> focal_;  // canonical order
    Eigen::VectorXd masses_;       // masses of the focal elements
    bool normalized_;
};
