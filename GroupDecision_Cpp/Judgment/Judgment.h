#pragma once

#include <string>
#include <vector>
#include <Eigen/Dense>

// Preference of a group of alternatives over the whole frame, on the 1..7 scale
struct GroupPreference {
    std::vector<std::string> alternatives;
    double preference;
};

// DS/AHP knowledge matrix of one expert for one criterion: disjoint groups
// compared against Θ, plus the criterion priority value p in [0, 1]
struct GroupJudgment {
    std::vector<GroupPreference> groups;
    double priorityValue;
};

enum class JudgmentKind { Pairwise, Groups };

// What one expert says about one criterion
struct Judgment {
    JudgmentKind kind;
    Eigen::MatrixXd matrix;  // Pairwise
    GroupJudgment groups;    // Groups

    static Judgment pairwise(const Eigen::MatrixXd& matrix) {
        Judgment j;
        j.kind = JudgmentKind::Pairwise;
        j.matrix = matrix;
        j.groups.priorityValue = 0.0;
        return j;
    }

    static Judgment grouped(const std::vector<GroupPreference>& groups, double priorityValue) {
        Judgment j;
        j.kind = JudgmentKind::Groups;
        j.groups.groups = groups;
        j.groups.priorityValue = priorityValue;
        return j;
    }
};
