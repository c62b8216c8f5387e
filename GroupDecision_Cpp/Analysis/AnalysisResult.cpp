#include "AnalysisResult.h"

#include <iomanip>
#include <ostream>
#include <stdexcept>

using namespace std;

const AlternativeAssessment& AnalysisResult::assessment(const string& alternative) const {
    for (const auto& a : ranking) {
        if (a.alternative == alternative) {
            return a;
        }
    }
    throw invalid_argument("Unknown alternative '" + alternative + "'.");
}

vector<FoldStep> AnalysisResult::allSteps() const {
    vector<FoldStep> steps;
    for (const auto& c : criteria) {
        steps.insert(steps.end(), c.steps.begin(), c.steps.end());
    }
    steps.insert(steps.end(), groupSteps.begin(), groupSteps.end());
    return steps;
}

size_t AnalysisResult::ruleCount(CombinationRule rule) const {
    size_t count = 0;
    for (const auto& s : allSteps()) {
        if (s.applied == rule) {
            ++count;
        }
    }
    return count;
}

void AnalysisResult::printReport(ostream& out) const {
    ios_base::fmtflags flags = out.flags();
    streamsize precision = out.precision();

    out << "Group assessment" << "\n";
    groupBpa.print(out, frame);

    out << "\n" << left << setw(6) << "Rank" << setw(16) << "Alternative"
        << right << setw(10) << "Score" << setw(10) << "Belief" << setw(14) << "Plausibility"
        << setw(10) << "Width" << "\n";
    out << fixed << setprecision(6);
    for (const auto& a : ranking) {
        out << left << setw(6) << a.rank << setw(16) << a.alternative
            << right << setw(10) << a.score << setw(10) << a.belief << setw(14) << a.plausibility
            << setw(10) << a.plausibility - a.belief << "\n";
    }
    out << "\nOptimal alternative: " << optimal() << "\n";

    vector<FoldStep> steps = allSteps();
    out << "Combination steps: " << steps.size()
        << " (Dempster " << ruleCount(CombinationRule::Dempster)
        << ", Yager " << ruleCount(CombinationRule::Yager) << ")\n";

    for (const auto& w : warnings) {
        out << "Warning: " << w << "\n";
    }

    out.flags(flags);
    out.precision(precision);
}
