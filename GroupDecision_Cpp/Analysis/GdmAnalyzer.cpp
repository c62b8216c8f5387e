#include "GdmAnalyzer.h"
#include "../Evidence/EvidenceErrors.h"

#include <ostream>
#include <set>
#include <stdexcept>

using namespace std;

static void checkProblem(const DecisionProblem& problem) {
    if (problem.criteria.empty()) {
        throw invalid_argument("At least one criterion is required.");
    }
    if (problem.experts.empty()) {
        throw invalid_argument("At least one expert is required.");
    }

    set<string> criteria;
    for (const auto& c : problem.criteria) {
        if (c.id.empty()) {
            throw invalid_argument("Criterion identifiers must not be empty.");
        }
        if (!criteria.insert(c.id).second) {
            throw invalid_argument("Duplicate criterion '" + c.id + "'.");
        }
    }

    set<string> experts;
    for (const auto& e : problem.experts) {
        if (e.id.empty()) {
            throw invalid_argument("Expert identifiers must not be empty.");
        }
        if (!experts.insert(e.id).second) {
            throw invalid_argument("Duplicate expert '" + e.id + "'.");
        }
        if (!(e.weight >= 0.0 && e.weight <= 1.0)) {
            throw invalid_argument("Weight of expert '" + e.id + "' must lie in [0, 1] (got " +
                                   to_string(e.weight) + ").");
        }
        for (const auto& j : e.judgments) {
            if (!criteria.count(j.first)) {
                throw invalid_argument("Expert '" + e.id + "' judges unknown criterion '" + j.first + "'.");
            }
        }
    }
}

GdmAnalyzer::GdmAnalyzer(const AnalysisConfig& config) : config_(config) {
    config_.validate();
}

AnalysisResult GdmAnalyzer::run(const DecisionProblem& problem) const {
    checkProblem(problem);
    const Frame frame(problem.alternatives);
    const BpaBuilder builder(frame, config_.builder);
    const AdaptiveCombiner combiner(config_.conflictThreshold, config_.rule);
    ostream* log = config_.log;

    vector<double> expertWeights;
    for (const auto& e : problem.experts) {
        expertWeights.push_back(e.weight);
    }
    const vector<double> expertFactors = discountFactors(expertWeights, config_.expertScaling);

    vector<double> criterionWeights;
    for (const auto& c : problem.criteria) {
        criterionWeights.push_back(c.weight);
    }
    const vector<double> normalizedWeights = normalizeWeights(criterionWeights);
    const vector<double> criterionFactors = discountFactors(normalizedWeights, config_.criterionScaling);

    if (log) {
        *log << "Group decision analysis: " << frame.size() << " alternatives, "
             << problem.criteria.size() << " criteria, " << problem.experts.size() << " experts\n";
        *log << "Rule: " << ruleName(config_.rule) << ", conflict threshold " << config_.conflictThreshold
             << ", pessimism " << config_.pessimism << "\n";
        for (size_t e = 0; e < problem.experts.size(); ++e) {
            *log << "  expert " << problem.experts[e].id << ": weight " << problem.experts[e].weight
                 << " -> discount factor " << expertFactors[e] << "\n";
        }
    }

    vector<JudgmentTrace> judgmentTraces;
    vector<CriterionTrace> criterionTraces;
    vector<string> warnings;
    vector<MassFunction> criterionBpas;
    vector<string> criterionLabels;

    for (size_t c = 0; c < problem.criteria.size(); ++c) {
        const Criterion& criterion = problem.criteria[c];
        vector<MassFunction> expertBpas;
        vector<string> expertLabels;

        if (log) {
            *log << "\nCriterion " << criterion.id << "\n";
        }

        for (size_t e = 0; e < problem.experts.size(); ++e) {
            const Expert& expert = problem.experts[e];
            auto it = expert.judgments.find(criterion.id);

            PriorityAnalysis none;
            none.lambdaMax = 0.0;
            none.consistencyIndex = 0.0;
            none.consistencyRatio = 0.0;
            BuiltBpa built{MassFunction::vacuous(frame.size()), none, true};
            JudgmentKind kind = JudgmentKind::Groups;

            if (it != expert.judgments.end()) {
                kind = it->second.kind;
                try {
                    built = builder.build(it->second);
                } catch (const MalformedMatrixError& ex) {
                    throw MalformedMatrixError(ex.detail(), expert.id, criterion.id);
                } catch (const MalformedJudgmentError& ex) {
                    throw MalformedJudgmentError(ex.detail(), expert.id, criterion.id);
                } catch (const InconsistentJudgmentError& ex) {
                    throw InconsistentJudgmentError(ex.consistencyRatio(), ex.threshold(), expert.id, criterion.id);
                }
                if (!built.consistent) {
                    string warning = "expert '" + expert.id + "', criterion '" + criterion.id +
                                     "': consistency ratio " + to_string(built.priorities.consistencyRatio) +
                                     " exceeds " + to_string(config_.builder.consistencyThreshold);
                    warnings.push_back(warning);
                    if (log) {
                        *log << "  warning: " << warning << "\n";
                    }
                }
            }

            MassFunction discounted = discount(built.bpa, expertFactors[e], config_.discountScheme);

            if (log) {
                *log << "  expert " << expert.id;
                if (it == expert.judgments.end()) {
                    *log << " (no judgment, total ignorance)";
                } else if (kind == JudgmentKind::Pairwise) {
                    *log << " (CR = " << built.priorities.consistencyRatio << ")";
                }
                *log << ", discounted BPA:\n";
                discounted.print(*log, frame);
            }

            judgmentTraces.push_back(JudgmentTrace{expert.id, criterion.id, it != expert.judgments.end(), kind,
                                                   built.priorities, built.consistent, expertFactors[e],
                                                   built.bpa, discounted});
            expertBpas.push_back(discounted);
            expertLabels.push_back(expert.id);
        }

        vector<FoldStep> steps;
        MassFunction combined = combiner.fold(expertBpas, expertLabels, "criterion " + criterion.id, steps);
        MassFunction discounted = discount(combined, criterionFactors[c], config_.discountScheme);

        if (log) {
            for (const auto& s : steps) {
                *log << "  step " << s.step << " (+" << s.source << "): K = " << s.conflict
                     << " -> " << ruleName(s.applied) << "\n";
            }
            *log << "  criterion weight " << normalizedWeights[c] << " -> discount factor "
                 << criterionFactors[c] << ", criterion BPA:\n";
            discounted.print(*log, frame);
        }

        criterionTraces.push_back(CriterionTrace{criterion.id, normalizedWeights[c], criterionFactors[c],
                                                 averagePairwiseConflict(expertBpas), steps, combined, discounted});
        criterionBpas.push_back(discounted);
        criterionLabels.push_back(criterion.id);
    }

    vector<FoldStep> groupSteps;
    MassFunction group = combiner.fold(criterionBpas, criterionLabels, "criteria", groupSteps);
    vector<AlternativeAssessment> ranking = rankAlternatives(group, frame, config_.pessimism);

    if (log) {
        *log << "\nAcross criteria\n";
        for (const auto& s : groupSteps) {
            *log << "  step " << s.step << " (+" << s.source << "): K = " << s.conflict
                 << " -> " << ruleName(s.applied) << "\n";
        }
        *log << "Group BPA:\n";
        group.print(*log, frame);
    }

    return AnalysisResult{frame, judgmentTraces, criterionTraces, groupSteps, group, ranking, warnings};
}
