#include "AnalysisConfig.h"

#include <stdexcept>
#include <string>

using namespace std;

static void checkUnitRange(double value, const string& name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw invalid_argument(name + " must lie in [0, 1] (got " + to_string(value) + ").");
    }
}

void AnalysisConfig::validate() const {
    checkUnitRange(conflictThreshold, "Conflict threshold");
    checkUnitRange(pessimism, "Pessimism coefficient");
    checkUnitRange(builder.confidence, "Confidence factor");
    if (!(builder.consistencyThreshold >= 0.0)) {
        throw invalid_argument("Consistency threshold must be non-negative (got " +
                               to_string(builder.consistencyThreshold) + ").");
    }
}
