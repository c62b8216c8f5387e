// =============================================================================
// BPA construction from expert judgments (Catch2)
// =============================================================================

#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>

#include "../Evidence/EvidenceErrors.h"
#include "../Evidence/Frame.h"
#include "../Judgment/BpaBuilder.h"

using Catch::Detail::Approx;
using Eigen::MatrixXd;
using Eigen::VectorXd;

namespace
{
    MatrixXd consistentMatrix()
    {
        VectorXd w(3);
        w << 0.5, 0.3, 0.2;
        return PairwiseMatrix::fromWeights(w).values();
    }

    MatrixXd cyclicMatrix()
    {
        MatrixXd a(3, 3);
        a << 1.0,       9.0,       1.0 / 9.0,
             1.0 / 9.0, 1.0,       9.0,
             9.0,       1.0 / 9.0, 1.0;
        return a;
    }
}

TEST_CASE("BpaBuilder: pairwise matrix to singleton masses", "[BpaBuilder]")
{
    Frame frame({"a", "b", "c"});

    SECTION("Fixed confidence keeps 1 - κ on Θ")
    {
        BpaBuilder builder(frame);
        BuiltBpa built = builder.fromMatrix(consistentMatrix());
        REQUIRE(built.consistent);
        REQUIRE(built.bpa.mass(frame.singleton("a")) == Approx(0.40));
        REQUIRE(built.bpa.mass(frame.singleton("b")) == Approx(0.24));
        REQUIRE(built.bpa.mass(frame.singleton("c")) == Approx(0.16));
        REQUIRE(built.bpa.mass(frame.theta()) == Approx(0.20));
        REQUIRE(built.bpa.totalMass() == Approx(1.0));
    }

    SECTION("Geometric mean priorities")
    {
        BpaBuilderOptions options;
        options.priorityMethod = PriorityMethod::GeometricMean;
        options.confidence = 0.5;
        BuiltBpa built = BpaBuilder(frame, options).fromMatrix(consistentMatrix());
        REQUIRE(built.bpa.mass(frame.singleton("a")) == Approx(0.25));
        REQUIRE(built.bpa.mass(frame.theta()) == Approx(0.5));
    }

    SECTION("Full confidence leaves nothing on Θ")
    {
        BpaBuilderOptions options;
        options.confidence = 1.0;
        BuiltBpa built = BpaBuilder(frame, options).fromMatrix(consistentMatrix());
        REQUIRE(built.bpa.mass(frame.theta()) == Approx(0.0).margin(1e-12));
        REQUIRE(built.bpa.mass(frame.singleton("a")) == Approx(0.5));
    }

    SECTION("Dimension must match the frame")
    {
        BpaBuilder builder(frame);
        REQUIRE_THROWS_AS(builder.fromMatrix(MatrixXd::Identity(2, 2)), MalformedMatrixError);
    }

    SECTION("Invalid options are rejected")
    {
        BpaBuilderOptions options;
        options.confidence = 1.2;
        REQUIRE_THROWS_AS(BpaBuilder(frame, options), std::invalid_argument);
        options.confidence = 0.8;
        options.consistencyThreshold = -0.1;
        REQUIRE_THROWS_AS(BpaBuilder(frame, options), std::invalid_argument);
    }
}

TEST_CASE("BpaBuilder: inconsistent judgments", "[BpaBuilder][Consistency]")
{
    Frame frame({"a", "b", "c"});

    SECTION("Rejected by default")
    {
        BpaBuilder builder(frame);
        REQUIRE_THROWS_AS(builder.fromMatrix(cyclicMatrix()), InconsistentJudgmentError);

        try {
            builder.fromMatrix(cyclicMatrix());
            FAIL("expected InconsistentJudgmentError");
        } catch (const InconsistentJudgmentError& e) {
            REQUIRE(e.consistencyRatio() > 0.1);
            REQUIRE(e.threshold() == Approx(0.1));
            REQUIRE(e.expert().empty());
        }
    }

    SECTION("Flagged when the policy is Warn")
    {
        BpaBuilderOptions options;
        options.consistencyPolicy = ConsistencyPolicy::Warn;
        BuiltBpa built = BpaBuilder(frame, options).fromMatrix(cyclicMatrix());
        REQUIRE_FALSE(built.consistent);
        REQUIRE(built.bpa.mass(frame.singleton("a")) == Approx(0.8 / 3));
        REQUIRE(built.bpa.mass(frame.theta()) == Approx(0.2));
    }

    SECTION("Consistency-scaled allocation withdraws belief from bad matrices")
    {
        BpaBuilderOptions options;
        options.consistencyPolicy = ConsistencyPolicy::Warn;
        options.allocation = MassAllocation::ConsistencyScaled;
        BuiltBpa built = BpaBuilder(frame, options).fromMatrix(cyclicMatrix());
        REQUIRE(built.bpa.isVacuous());
    }

    SECTION("Consistency-scaled allocation is plain κ for consistent matrices")
    {
        BpaBuilderOptions options;
        options.allocation = MassAllocation::ConsistencyScaled;
        BuiltBpa built = BpaBuilder(frame, options).fromMatrix(consistentMatrix());
        REQUIRE(built.bpa.mass(frame.theta()) == Approx(0.2));
    }
}

TEST_CASE("BpaBuilder: group judgments", "[BpaBuilder][Groups]")
{
    Frame frame({"a", "b", "c", "d"});
    BpaBuilder builder(frame);

    SECTION("Masses of groups and Θ")
    {
        GroupJudgment judgment{{{{"a"}, 5.0}, {{"b", "c"}, 3.0}}, 0.5};
        MassFunction m = builder.fromGroups(judgment);
        const double denominator = 2.5 + 1.5 + std::sqrt(2.0);
        REQUIRE(m.mass(frame.singleton("a")) == Approx(2.5 / denominator));
        REQUIRE(m.mass(frame.subset({"b", "c"})) == Approx(1.5 / denominator));
        REQUIRE(m.mass(frame.theta()) == Approx(std::sqrt(2.0) / denominator));
        REQUIRE(m.mass(frame.singleton("a")) == Approx(0.46174).epsilon(1e-4));
        REQUIRE(m.totalMass() == Approx(1.0));
    }

    SECTION("Zero priority value or no groups is total ignorance")
    {
        REQUIRE(builder.fromGroups(GroupJudgment{{{{"a"}, 5.0}}, 0.0}).isVacuous());
        REQUIRE(builder.fromGroups(GroupJudgment{{}, 0.7}).isVacuous());
    }

    SECTION("Malformed groups are rejected")
    {
        REQUIRE_THROWS_AS(builder.fromGroups(GroupJudgment{{{{"a"}, 2.0}, {{"a", "b"}, 3.0}}, 0.5}),
                          MalformedJudgmentError);
        REQUIRE_THROWS_AS(builder.fromGroups(GroupJudgment{{{{"z"}, 2.0}}, 0.5}), MalformedJudgmentError);
        REQUIRE_THROWS_AS(builder.fromGroups(GroupJudgment{{{{}, 2.0}}, 0.5}), MalformedJudgmentError);
        REQUIRE_THROWS_AS(builder.fromGroups(GroupJudgment{{{{"a"}, 0.0}}, 0.5}), MalformedJudgmentError);
        REQUIRE_THROWS_AS(builder.fromGroups(GroupJudgment{{{{"a"}, 2.0}}, 1.5}), MalformedJudgmentError);
    }

    SECTION("build dispatches on the judgment kind")
    {
        BuiltBpa grouped = builder.build(Judgment::grouped({{{"d"}, 4.0}}, 1.0));
        REQUIRE(grouped.consistent);
        REQUIRE(grouped.bpa.mass(frame.singleton("d")) == Approx(0.8));
        REQUIRE(grouped.bpa.mass(frame.theta()) == Approx(0.2));

        BuiltBpa pairwise = builder.build(Judgment::pairwise(MatrixXd::Ones(4, 4)));
        REQUIRE(pairwise.bpa.mass(frame.singleton("b")) == Approx(0.2));
    }
}
