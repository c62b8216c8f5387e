// =============================================================================
// Frame and MassFunction unit tests (Catch2)
// =============================================================================

#include <catch2/catch.hpp>

#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../Evidence/EvidenceErrors.h"
#include "../Evidence/Frame.h"
#include "../Evidence/MassFunction.h"

using Catch::Detail::Approx;

TEST_CASE("Frame: alternatives map to singleton bits", "[Frame]")
{
    Frame frame({"a", "b", "c"});

    REQUIRE(frame.size() == 3);
    REQUIRE(frame.theta() == FocalSet(0x7));
    REQUIRE(frame.singleton("a") == FocalSet(0x1));
    REQUIRE(frame.singleton("c") == FocalSet(0x4));
    REQUIRE(frame.subset({"a", "c"}) == FocalSet(0x5));
    REQUIRE(frame.indexOf("b") == 1);
    REQUIRE(cardinality(frame.theta()) == 3);

    REQUIRE(frame.label(frame.theta()) == "Θ");
    REQUIRE(frame.label(frame.subset({"c", "a"})) == "{a, c}");
}

TEST_CASE("Frame: invalid frames are rejected", "[Frame]")
{
    REQUIRE_THROWS_AS(Frame(std::vector<std::string>()), std::invalid_argument);
    REQUIRE_THROWS_AS(Frame({"a", "b", "a"}), std::invalid_argument);
    REQUIRE_THROWS_AS(Frame({"a", ""}), std::invalid_argument);

    std::vector<std::string> many;
    for (int i = 0; i < 65; ++i) {
        many.push_back("x" + std::to_string(i));
    }
    REQUIRE_THROWS_AS(Frame(many), std::invalid_argument);

    Frame frame({"a", "b"});
    REQUIRE_THROWS_AS(frame.singleton("z"), std::invalid_argument);
}

TEST_CASE("MassFunction: construction enforces the BPA invariants", "[MassFunction]")
{
    Frame frame({"a", "b", "c"});
    const FocalSet a = frame.singleton("a");
    const FocalSet ab = frame.subset({"a", "b"});

    SECTION("Valid assignment keeps focal elements in canonical order")
    {
        std::map<FocalSet, double> m;
        m[frame.theta()] = 0.2;
        m[ab] = 0.3;
        m[a] = 0.5;
        MassFunction bpa(frame.size(), m);

        REQUIRE(bpa.size() == 3);
        REQUIRE(bpa.focalElements()[0] == a);
        REQUIRE(bpa.focalElements()[1] == ab);
        REQUIRE(bpa.focalElements()[2] == frame.theta());
        REQUIRE(bpa.mass(ab) == Approx(0.3));
        REQUIRE(bpa.mass(frame.singleton("c")) == 0.0);
        REQUIRE(bpa.totalMass() == Approx(1.0));
        REQUIRE(bpa.isNormalized());
    }

    SECTION("Zero masses are dropped")
    {
        std::map<FocalSet, double> m;
        m[a] = 1.0;
        m[ab] = 0.0;
        MassFunction bpa(frame.size(), m);
        REQUIRE(bpa.size() == 1);
    }

    SECTION("Masses that do not sum to one are rejected")
    {
        std::map<FocalSet, double> m;
        m[a] = 0.5;
        m[ab] = 0.4;
        REQUIRE_THROWS_AS(MassFunction(frame.size(), m), InvalidBPAError);
    }

    SECTION("Negative and oversized masses are rejected")
    {
        std::map<FocalSet, double> m;
        m[a] = 1.2;
        m[ab] = -0.2;
        REQUIRE_THROWS_AS(MassFunction(frame.size(), m), InvalidBPAError);
    }

    SECTION("Empty set mass requires an unnormalized BPA")
    {
        std::map<FocalSet, double> m;
        m[EMPTY_SET] = 0.25;
        m[a] = 0.75;
        REQUIRE_THROWS_AS(MassFunction(frame.size(), m), InvalidBPAError);

        MassFunction unnormalized(frame.size(), m, false);
        REQUIRE_FALSE(unnormalized.isNormalized());
        REQUIRE(unnormalized.massOfEmptySet() == Approx(0.25));
    }

    SECTION("Focal elements outside the frame are rejected")
    {
        std::map<FocalSet, double> m;
        m[FocalSet(0x8)] = 1.0;
        REQUIRE_THROWS_AS(MassFunction(frame.size(), m), InvalidBPAError);
    }

    SECTION("Drift within the tolerance is accepted")
    {
        std::map<FocalSet, double> m;
        m[a] = 0.3 + 1e-12;
        m[frame.theta()] = 0.7;
        REQUIRE_NOTHROW(MassFunction(frame.size(), m));
    }
}

TEST_CASE("MassFunction: belief and plausibility of query sets", "[MassFunction]")
{
    Frame frame({"a", "b", "c"});
    std::map<FocalSet, double> m;
    m[frame.singleton("a")] = 0.4;
    m[frame.subset({"a", "b"})] = 0.3;
    m[frame.singleton("c")] = 0.1;
    m[frame.theta()] = 0.2;
    MassFunction bpa(frame.size(), m);

    REQUIRE(bpa.belief(frame.singleton("a")) == Approx(0.4));
    REQUIRE(bpa.plausibility(frame.singleton("a")) == Approx(0.9));
    REQUIRE(bpa.belief(frame.subset({"a", "b"})) == Approx(0.7));
    REQUIRE(bpa.plausibility(frame.singleton("b")) == Approx(0.5));
    REQUIRE(bpa.belief(frame.theta()) == Approx(1.0));
    REQUIRE(bpa.plausibility(frame.singleton("c")) == Approx(0.3));
}

TEST_CASE("MassFunction: vacuous and categorical assignments", "[MassFunction]")
{
    MassFunction vacuous = MassFunction::vacuous(4);
    REQUIRE(vacuous.isVacuous());
    REQUIRE(vacuous.mass(FocalSet(0xF)) == 1.0);

    MassFunction categorical = MassFunction::categorical(4, FocalSet(0x2));
    REQUIRE_FALSE(categorical.isVacuous());
    REQUIRE(categorical.belief(FocalSet(0x2)) == 1.0);

    REQUIRE(vacuous.approxEquals(MassFunction::vacuous(4)));
    REQUIRE_FALSE(vacuous.approxEquals(categorical));
    REQUIRE_FALSE(vacuous.approxEquals(MassFunction::vacuous(3)));
}

TEST_CASE("MassFunction: print labels focal elements by alternative", "[MassFunction]")
{
    Frame frame({"x", "y"});
    std::map<FocalSet, double> m;
    m[frame.singleton("x")] = 0.25;
    m[frame.theta()] = 0.75;
    MassFunction bpa(frame.size(), m);

    std::ostringstream out;
    bpa.print(out, frame);
    REQUIRE(out.str().find("m({x}) = 0.250000") != std::string::npos);
    REQUIRE(out.str().find("m(Θ) = 0.750000") != std::string::npos);
}
