#include <iostream>
#include <Eigen/Dense>

#include "../Analysis/GdmAnalyzer.h"
#include "../Evidence/EvidenceErrors.h"

using namespace std;
using namespace Eigen;

// Three experts choose among three suppliers under three criteria.
// E1 and E2 give pairwise comparison matrices, E1 and E3 also judge delivery
// by groups of suppliers, E3 says nothing about quality.
DecisionProblem supplier_selection_problem() {
    DecisionProblem problem;
    problem.alternatives = {"SupplierA", "SupplierB", "SupplierC"};
    problem.criteria = {{"Price", 0.5}, {"Quality", 0.3}, {"Delivery", 0.2}};

    MatrixXd e1_price(3, 3);
    e1_price << 1.0, 3.0, 5.0,
                1.0 / 3, 1.0, 2.0,
                1.0 / 5, 1.0 / 2, 1.0;
    MatrixXd e1_quality(3, 3);
    e1_quality << 1.0, 1.0 / 2, 2.0,
                  2.0, 1.0, 3.0,
                  1.0 / 2, 1.0 / 3, 1.0;

    Expert e1;
    e1.id = "E1";
    e1.weight = 0.9;
    e1.judgments["Price"] = Judgment::pairwise(e1_price);
    e1.judgments["Quality"] = Judgment::pairwise(e1_quality);
    e1.judgments["Delivery"] = Judgment::grouped({{{"SupplierC"}, 5}, {{"SupplierA", "SupplierB"}, 2}}, 0.3);

    MatrixXd e2_price(3, 3);
    e2_price << 1.0, 2.0, 4.0,
                1.0 / 2, 1.0, 2.0,
                1.0 / 4, 1.0 / 2, 1.0;
    MatrixXd e2_quality(3, 3);
    e2_quality << 1.0, 1.0 / 3, 1.0,
                  3.0, 1.0, 3.0,
                  1.0, 1.0 / 3, 1.0;
    MatrixXd e2_delivery(3, 3);
    e2_delivery << 1.0, 1.0, 1.0 / 3,
                   1.0, 1.0, 1.0 / 3,
                   3.0, 3.0, 1.0;

    Expert e2;
    e2.id = "E2";
    e2.weight = 0.7;
    e2.judgments["Price"] = Judgment::pairwise(e2_price);
    e2.judgments["Quality"] = Judgment::pairwise(e2_quality);
    e2.judgments["Delivery"] = Judgment::pairwise(e2_delivery);

    MatrixXd e3_price(3, 3);
    e3_price << 1.0, 1.0 / 2, 3.0,
                2.0, 1.0, 5.0,
                1.0 / 3, 1.0 / 5, 1.0;

    Expert e3;
    e3.id = "E3";
    e3.weight = 0.5;
    e3.judgments["Price"] = Judgment::pairwise(e3_price);
    e3.judgments["Delivery"] = Judgment::grouped({{{"SupplierB"}, 4}}, 0.5);

    problem.experts = {e1, e2, e3};
    return problem;
}

int main() {
    try {
        AnalysisConfig config;
        config.rule = CombinationRule::Adaptive;
        config.conflictThreshold = 0.4;
        config.log = &cout;

        GdmAnalyzer analyzer(config);
        AnalysisResult result = analyzer.run(supplier_selection_problem());

        cout << "\n";
        result.printReport(cout);
    } catch (const JudgmentError& e) {
        cerr << "Judgment error: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
