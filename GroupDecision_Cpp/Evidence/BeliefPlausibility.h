#pragma once

#include <string>
#include <vector>

#include "Frame.h"
#include "MassFunction.h"

const double DEFAULT_PESSIMISM = 0.5;

// Belief/plausibility interval of one alternative
struct AlternativeAssessment {
    std::string alternative;
    double belief;
    double plausibility;
    double score;       // pessimism * belief + (1 - pessimism) * plausibility
    std::size_t rank;   // 1 = best
};

// pessimism = 0.5 gives the midpoint of [Bel, Pl]
double intervalScore(double belief, double plausibility, double pessimism = DEFAULT_PESSIMISM);

// Bel and Pl of every singleton, in frame order, ranks left at 0
std::vector<AlternativeAssessment> assessAlternatives(const MassFunction& m, const Frame& frame,
                                                      double pessimism = DEFAULT_PESSIMISM);

// Assessments sorted by score descending, then belief descending, then
// alternative id; ranks assigned 1..n.
std::vector<AlternativeAssessment> rankAlternatives(const MassFunction& m, const Frame& frame,
                                                    double pessimism = DEFAULT_PESSIMISM);
