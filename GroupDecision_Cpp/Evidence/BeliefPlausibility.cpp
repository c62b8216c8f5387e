#include "BeliefPlausibility.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

// Scores closer than this are ties
static const double SCORE_RESOLUTION = 1e-12;

static double quantize(double value) {
    return round(value / SCORE_RESOLUTION);
}

double intervalScore(double belief, double plausibility, double pessimism) {
    if (!(pessimism >= 0.0 && pessimism <= 1.0)) {
        throw invalid_argument("Pessimism coefficient must lie in [0, 1] (got " + to_string(pessimism) + ").");
    }
    return pessimism * belief + (1.0 - pessimism) * plausibility;
}

vector<AlternativeAssessment> assessAlternatives(const MassFunction& m, const Frame& frame, double pessimism) {
    if (m.frameSize() != frame.size()) {
        throw invalid_argument("Mass function and frame sizes differ (" + to_string(m.frameSize()) +
                               " vs " + to_string(frame.size()) + ").");
    }

    vector<AlternativeAssessment> result;
    result.reserve(frame.size());
    for (size_t i = 0; i < frame.size(); ++i) {
        FocalSet a = frame.singleton(i);
        AlternativeAssessment assessment;
        assessment.alternative = frame.alternative(i);
        assessment.belief = m.belief(a);
        assessment.plausibility = m.plausibility(a);
        // Rounding can leave Bel a few ulps above Pl when both come from the same single mass
        assessment.belief = min(assessment.belief, assessment.plausibility);
        assessment.score = intervalScore(assessment.belief, assessment.plausibility, pessimism);
        assessment.rank = 0;
        result.push_back(assessment);
    }
    return result;
}

vector<AlternativeAssessment> rankAlternatives(const MassFunction& m, const Frame& frame, double pessimism) {
    vector<AlternativeAssessment> ranked = assessAlternatives(m, frame, pessimism);
    sort(ranked.begin(), ranked.end(), [](const AlternativeAssessment& a, const AlternativeAssessment& b) {
        double sa = quantize(a.score), sb = quantize(b.score);
        if (sa != sb) return sa > sb;
        double ba = quantize(a.belief), bb = quantize(b.belief);
        if (ba != bb) return ba > bb;
        return a.alternative < b.alternative;
    });
    for (size_t i = 0; i < ranked.size(); ++i) {
        ranked[i].rank = i + 1;
    }
    return ranked;
}
