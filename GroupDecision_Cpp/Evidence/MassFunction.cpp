#include "MassFunction.h"
#include "EvidenceErrors.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <string>

using namespace std;
using namespace Eigen;

constexpr double MassFunction::TOLERANCE;

static FocalSet fullSet(size_t frameSize) {
    return frameSize >= 64 ? ~FocalSet(0) : (FocalSet(1) << frameSize) - 1;
}

MassFunction::MassFunction(size_t frameSize, const map<FocalSet, double>& masses, bool normalized)
    : frameSize_(frameSize), theta_(fullSet(frameSize)), normalized_(normalized) {
    // Input checks
    if (frameSize == 0 || frameSize > Frame::MAX_ALTERNATIVES) {
        throw InvalidBPAError("Frame size must be between 1 and " + to_string(Frame::MAX_ALTERNATIVES) +
                              " (got " + to_string(frameSize) + ").");
    }
    if (masses.empty()) {
        throw InvalidBPAError("A mass function needs at least one focal element.");
    }

    focal_.reserve(masses.size());
    vector<double> values;
    values.reserve(masses.size());
    double sum = 0.0;
    for (const auto& entry : masses) {
        double m = entry.second;
        if (!std::isfinite(m) || m < -TOLERANCE || m > 1 + TOLERANCE) {
            throw InvalidBPAError("Masses must lie in [0, 1] (got " + to_string(m) + ").");
        }
        if (!isSubset(entry.first, theta_)) {
            throw InvalidBPAError("Focal element lies outside the frame of discernment.");
        }
        m = min(max(m, 0.0), 1.0);
        if (m == 0.0) {
            continue;
        }
        if (entry.first == EMPTY_SET && normalized) {
            throw InvalidBPAError("A normalized mass function cannot assign mass to the empty set (got " +
                                  to_string(m) + ").");
        }
        focal_.push_back(entry.first);
        values.push_back(m);
        sum += m;
    }
    if (abs(sum - 1) > TOLERANCE) {
        throw InvalidBPAError("The masses must sum to 1 (current sum: " + to_string(sum) + ").");
    }

    masses_ = Map<const VectorXd>(values.data(), static_cast<Index>(values.size()));
}

MassFunction MassFunction::vacuous(size_t frameSize) {
    map<FocalSet, double> m;
    m[fullSet(frameSize)] = 1.0;
    return MassFunction(frameSize, m);
}

MassFunction MassFunction::categorical(size_t frameSize, FocalSet focal) {
    map<FocalSet, double> m;
    m[focal] = 1.0;
    return MassFunction(frameSize, m);
}

map<FocalSet, double> MassFunction::toMap() const {
    map<FocalSet, double> result;
    for (size_t i = 0; i < focal_.size(); ++i) {
        result[focal_[i]] = masses_(static_cast<Index>(i));
    }
    return result;
}

double MassFunction::mass(FocalSet s) const {
    auto it = lower_bound(focal_.begin(), focal_.end(), s);
    if (it == focal_.end() || *it != s) {
        return 0.0;
    }
    return masses_(static_cast<Index>(it - focal_.begin()));
}

bool MassFunction::isVacuous() const {
    return focal_.size() == 1 && focal_[0] == theta_;
}

double MassFunction::belief(FocalSet query) const {
    double bel = 0.0;
    for (size_t i = 0; i < focal_.size(); ++i) {
        if (focal_[i] != EMPTY_SET && isSubset(focal_[i], query)) {
            bel += masses_(static_cast<Index>(i));
        }
    }
    return bel;
}

double MassFunction::plausibility(FocalSet query) const {
    double pl = 0.0;
    for (size_t i = 0; i < focal_.size(); ++i) {
        if (intersect(focal_[i], query) != EMPTY_SET) {
            pl += masses_(static_cast<Index>(i));
        }
    }
    return pl;
}

bool MassFunction::approxEquals(const MassFunction& other, double tolerance) const {
    if (frameSize_ != other.frameSize_) {
        return false;
    }
    // Focal sets present in only one of the two count against the other's zero
    map<FocalSet, double> diff = toMap();
    for (size_t i = 0; i < other.focal_.size(); ++i) {
        diff[other.focal_[i]] -= other.masses_(static_cast<Index>(i));
    }
    for (const auto& entry : diff) {
        if (abs(entry.second) > tolerance) {
            return false;
        }
    }
    return true;
}

void MassFunction::print(ostream& out, const Frame& frame) const {
    ios_base::fmtflags flags = out.flags();
    streamsize precision = out.precision();
    out << fixed << setprecision(6);
    for (size_t i = 0; i < focal_.size(); ++i) {
        string name = focal_[i] == EMPTY_SET ? "∅" : frame.label(focal_[i]);
        out << "  m(" << name << ") = " << masses_(static_cast<Index>(i)) << "\n";
    }
    out << "  sum = " << totalMass();
    if (!normalized_) {
        out << " (unnormalized)";
    }
    out << "\n";
    out.flags(flags);
    out.precision(precision);
}
