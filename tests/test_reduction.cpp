/*
===============================================================================
TEST REDUCTION — Tests for reduction.h
===============================================================================

OVERVIEW
--------
Validates ReductionTester: associative reductions agree under every merge
scheme, non-associative or order-dependent combiners are caught per scheme,
identityFinish is enforced, custom equivalences replace operator==, and
reducer errors become violations.

TEST ORGANIZATION
-----------------
• Section A: Merge schemes
• Section B: Conforming reductions
• Section C: Broken reductions
• Section D: Equivalence and result types
• Section E: Errors, logging and reporting

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• reduction.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>
#include <splitkit/reduction.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace splitkit;

namespace {

    using SumReducer = Reducer<int, long, long>;

    SumReducer summing() {
        return SumReducer{
            [] { return 0L; },
            [](long& acc, const int& v) { acc += v; },
            [](long a, long b) { return a + b; },
            [](long a) { return a; },
            true
        };
    }

    bool hasViolation(const ConformanceReport& report, const std::string& check, std::string_view scheme) {
        const auto& vs = report.violations();
        return std::any_of(vs.begin(), vs.end(),
            [&](const Violation& v) { return v.check == check && v.strategy == scheme; });
    }

    struct Box {
        int value;
    };

} // namespace

// ============================================================================
// SECTION A: MERGE SCHEMES
// ============================================================================

TEST_CASE("A1: Schemes::NamesAndOrder", "[reduction][schemes]")
{
    STATIC_REQUIRE(mergeSchemeName(MergeScheme::Sequential) == "sequential");
    STATIC_REQUIRE(mergeSchemeName(MergeScheme::MergeLeftAssociative) == "mergeLeftAssociative");
    STATIC_REQUIRE(mergeSchemeName(MergeScheme::MergeRightAssociative) == "mergeRightAssociative");
    STATIC_REQUIRE(enum_size_v<MergeScheme> == 3);
}

/**
 * @test Schemes::CombineOrderIsObservable
 * @brief A subtracting combiner exposes the fold direction of each scheme
 *
 * @given accumulate = +=, combine = a - b, inputs {1, 2, 3}
 * @then sequential = 6, left = ((0-1)-2)-3 = -6, right = 1-(2-(3-0)) = 2
 */
TEST_CASE("A2: Schemes::CombineOrderIsObservable", "[reduction][schemes]")
{
    auto r = summing();
    r.combiner = [](long a, long b) { return a - b; };
    const std::vector<int> inputs{ 1, 2, 3 };

    REQUIRE(reduceWith(MergeScheme::Sequential, r, inputs) == 6);
    REQUIRE(reduceWith(MergeScheme::MergeLeftAssociative, r, inputs) == -6);
    REQUIRE(reduceWith(MergeScheme::MergeRightAssociative, r, inputs) == 2);
}

TEST_CASE("A3: Schemes::EmptyInputIsFreshAccumulator", "[reduction][schemes][edge]")
{
    auto r = summing();
    r.supplier = [] { return 7L; };
    const std::vector<int> none;

    for (MergeScheme m : enum_values<MergeScheme>()) {
        REQUIRE(reduceWith(m, r, none) == 7);
    }
    REQUIRE_THROWS_AS(reduceWith(MergeScheme::COUNT, r, none), std::out_of_range);
}

// ============================================================================
// SECTION B: CONFORMING REDUCTIONS
// ============================================================================

TEST_CASE("B1: Conforming::SumAgreesEverywhere", "[reduction][pass]")
{
    ReductionTester<int, long, long> tester(summing());
    tester.expectReduces(6, { 1, 2, 3 })
        .expectReduces(0, {})
        .expectReduces(-4, { -4 })
        .expectReduces(5050, [] {
            std::vector<int> v(100);
            for (int i = 0; i < 100; ++i) v[static_cast<std::size_t>(i)] = i + 1;
            return v;
        }());

    const auto& report = tester.report();
    INFO(report.summary());
    REQUIRE(report.ok());
    REQUIRE(report.passed() == std::vector<std::string>{ "reduces#1", "reduces#2", "reduces#3", "reduces#4" });
}

TEST_CASE("B2: Conforming::StringConcatenation", "[reduction][pass]")
{
    Reducer<std::string, std::string, std::string> concat{
        [] { return std::string(); },
        [](std::string& acc, const std::string& s) { acc += s; },
        [](std::string a, std::string b) { return a + b; },
        [](std::string a) { return a; },
        true
    };

    auto report = ReductionTester<std::string, std::string, std::string>(concat)
        .expectReduces("abc", { "a", "b", "c" })
        .expectReduces("", {})
        .report();
    INFO(report.summary());
    REQUIRE(report.ok());
}

TEST_CASE("B3: Conforming::AccumulatorNotConvertibleToResult", "[reduction][pass]")
{
    Reducer<int, std::vector<int>, std::size_t> counting{
        [] { return std::vector<int>(); },
        [](std::vector<int>& acc, const int& v) { acc.push_back(v); },
        [](std::vector<int> a, std::vector<int> b) {
            a.insert(a.end(), b.begin(), b.end());
            return a;
        },
        [](std::vector<int> a) { return a.size(); },
        true
    };

    auto report = ReductionTester<int, std::vector<int>, std::size_t>(counting)
        .expectReduces(3, { 4, 5, 6 })
        .report();
    REQUIRE(report.ok());
}

// ============================================================================
// SECTION C: BROKEN REDUCTIONS
// ============================================================================

TEST_CASE("C1: Broken::NonAssociativeCombiner", "[reduction][fault]")
{
    auto r = summing();
    r.combiner = [](long a, long b) { return a - b; };

    auto report = ReductionTester<int, long, long>(r).expectReduces(6, { 1, 2, 3 }).report();

    REQUIRE_FALSE(report.ok());
    REQUIRE_FALSE(hasViolation(report, "reduces#1", "sequential"));
    REQUIRE(hasViolation(report, "reduces#1", "mergeLeftAssociative"));
    REQUIRE(hasViolation(report, "reduces#1", "mergeRightAssociative"));
    REQUIRE(report.passed().empty());
}

TEST_CASE("C2: Broken::CombinerDropsLeftOperand", "[reduction][fault]")
{
    auto r = summing();
    r.combiner = [](long, long b) { return b; };

    auto report = ReductionTester<int, long, long>(r).expectReduces(6, { 1, 2, 3 }).report();
    REQUIRE(report.failed("reduces#1"));
    REQUIRE(report.violations().front().message.find("differs from expected 6") != std::string::npos);
}

/**
 * @test Broken::IdentityFinishMustHold
 * @brief A reducer claiming identityFinish must not transform in its finisher
 */
TEST_CASE("C3: Broken::IdentityFinishMustHold", "[reduction][fault]")
{
    auto r = summing();
    r.finisher = [](long a) { return a * 2; };

    SECTION("Declared identity: the raw accumulator is checked too")
    {
        auto report = ReductionTester<int, long, long>(r).expectReduces(12, { 1, 2, 3 }).report();
        REQUIRE(report.failed("reduces#1"));
        REQUIRE(report.violations().size() == 3);
        REQUIRE(report.violations().front().message.rfind("unfinished accumulator", 0) == 0);
    }

    SECTION("No identity declared: only the finished result counts")
    {
        r.identityFinish = false;
        auto report = ReductionTester<int, long, long>(r).expectReduces(12, { 1, 2, 3 }).report();
        REQUIRE(report.ok());
    }
}

// ============================================================================
// SECTION D: EQUIVALENCE
// ============================================================================

TEST_CASE("D1: Equivalence::ToleranceForFloatingPoint", "[reduction][equivalence]")
{
    Reducer<double, double, double> sum{
        [] { return 0.0; },
        [](double& acc, const double& v) { acc += v; },
        [](double a, double b) { return a + b; },
        [](double a) { return a; },
        true
    };
    const std::vector<double> inputs{ 0.1, 0.2, 0.3 };

    auto exact = ReductionTester<double, double, double>(sum).expectReduces(0.6, inputs).report();
    REQUIRE_FALSE(exact.ok());

    auto close = ReductionTester<double, double, double>(sum,
        [](const double& a, const double& b) { return std::abs(a - b) < 1e-9; })
        .expectReduces(0.6, inputs)
        .report();
    REQUIRE(close.ok());
}

TEST_CASE("D2: Equivalence::RequiredWithoutOperatorEquals", "[reduction][equivalence]")
{
    Reducer<int, int, Box> boxed{
        [] { return 0; },
        [](int& acc, const int& v) { acc += v; },
        [](int a, int b) { return a + b; },
        [](int a) { return Box{ a }; },
        false
    };

    REQUIRE_THROWS_AS((ReductionTester<int, int, Box>(boxed)), std::invalid_argument);

    auto report = ReductionTester<int, int, Box>(boxed,
        [](const Box& a, const Box& b) { return a.value == b.value; })
        .expectReduces(Box{ 3 }, { 1, 2 })
        .expectReduces(Box{ 4 }, { 1, 2 })
        .report();
    REQUIRE(report.hasPassed("reduces#1"));
    REQUIRE(report.failed("reduces#2"));
    REQUIRE(report.violations().front().message.find("<?>") != std::string::npos);
}

// ============================================================================
// SECTION E: ERRORS, LOGGING, REPORTING
// ============================================================================

TEST_CASE("E1: Errors::EmptyReducerFunction", "[reduction][errors]")
{
    auto r = summing();

    SECTION("supplier")
    {
        r.supplier = nullptr;
        REQUIRE_THROWS_AS((ReductionTester<int, long, long>(r)), std::invalid_argument);
    }

    SECTION("combiner")
    {
        r.combiner = nullptr;
        REQUIRE_THROWS_AS((ReductionTester<int, long, long>(r)), std::invalid_argument);
    }

    SECTION("finisher")
    {
        r.finisher = nullptr;
        REQUIRE_THROWS_AS((ReductionTester<int, long, long>(r)), std::invalid_argument);
    }
}

TEST_CASE("E2: Errors::ThrowingAccumulatorIsAViolation", "[reduction][errors]")
{
    auto r = summing();
    r.accumulator = [](long&, const int& v) {
        if (v < 0) throw std::domain_error("negative input");
    };

    auto report = ReductionTester<int, long, long>(r).expectReduces(0, { -1 }).report();
    REQUIRE(report.violations().size() == 3);
    for (MergeScheme m : enum_values<MergeScheme>()) {
        REQUIRE(hasViolation(report, "reduces#1", mergeSchemeName(m)));
    }
    REQUIRE(report.violations().front().message == "reduction threw: negative input");
}

TEST_CASE("E3: Logging::PassAndFailLines", "[reduction][logging]")
{
    std::ostringstream log;
    auto r = summing();
    r.combiner = [](long a, long b) { return a - b; };

    auto report = ReductionTester<int, long, long>(r, {}, HarnessOptions{}.withLog(log, true))
        .expectReduces(0, {})
        .expectReduces(6, { 1, 2, 3 })
        .report();

    REQUIRE(report.hasPassed("reduces#1"));
    REQUIRE(log.str().find("[splitkit] check=reduces#1 strategy=- result=pass") != std::string::npos);
    REQUIRE(log.str().find("check=reduces#2 strategy=mergeLeftAssociative result=FAIL") != std::string::npos);
    REQUIRE_THROWS_AS(report.throwIfFailed(), ConformanceError);
}
