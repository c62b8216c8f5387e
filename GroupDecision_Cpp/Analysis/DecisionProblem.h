#pragma once

#include <map>
#include <string>
#include <vector>

#include "../Judgment/Judgment.h"

struct Criterion {
    std::string id;
    double weight;  // >= 0, normalized over all criteria before use
};

struct Expert {
    std::string id;
    double weight;  // importance in [0, 1]
    // Keyed by criterion id; a missing criterion counts as total ignorance
    std::map<std::string, Judgment> judgments;
};

// Everything an input loader hands over for one analysis run.
// The order of criteria and experts is the fold order.
struct DecisionProblem {
    std::vector<std::string> alternatives;
    std::vector<Criterion> criteria;
    std::vector<Expert> experts;
};
