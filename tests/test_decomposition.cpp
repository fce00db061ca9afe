/*
===============================================================================
TEST DECOMPOSITION — Tests for decomposition.h
===============================================================================

OVERVIEW
--------
Validates the three draining strategies and the split-tree inspection:
every strategy visits the same elements in the same order on ordered
sources, MaximumSplit visits prefixes before remainders, and repeated
midpoint splitting stays within ceil(log2(n)) levels.

TEST ORGANIZATION
-----------------
• Section A: Strategy names and enumeration
• Section B: Strategy agreement
• Section C: Split tree shape
• Section D: Error handling

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• decomposition.h, indexed_source.h, singleton_source.h

===============================================================================
*/

#include <catch2/catch.hpp>
#include <splitkit/decomposition.h>
#include <splitkit/indexed_source.h>
#include <splitkit/singleton_source.h>

#include <cstddef>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace splitkit;

namespace {

    std::vector<int> iota(std::size_t n) {
        std::vector<int> v(n);
        std::iota(v.begin(), v.end(), 0);
        return v;
    }

    auto identitySource(std::size_t n) {
        return indexed<int>(n, [](std::size_t i) { return static_cast<int>(i); },
            Characteristic::Ordered);
    }

    std::size_t ceilLog2(std::size_t n) {
        std::size_t depth = 0;
        std::size_t span = 1;
        while (span < n) {
            span <<= 1;
            ++depth;
        }
        return depth;
    }

} // namespace

// ============================================================================
// SECTION A: NAMES
// ============================================================================

TEST_CASE("A1: Strategies::NamesAndOrder", "[decomposition][names]")
{
    STATIC_REQUIRE(strategyName(Strategy::BulkDrain) == "bulkDrain");
    STATIC_REQUIRE(strategyName(Strategy::StepAdvance) == "stepAdvance");
    STATIC_REQUIRE(strategyName(Strategy::MaximumSplit) == "maximumSplit");
    STATIC_REQUIRE(strategyName(Strategy::COUNT) == "unknown");

    constexpr auto all = allStrategies();
    STATIC_REQUIRE(all.size() == 3);
    REQUIRE(all[0] == Strategy::BulkDrain);
    REQUIRE(all[2] == Strategy::MaximumSplit);

    std::ostringstream os;
    os << Strategy::StepAdvance;
    REQUIRE(os.str() == "stepAdvance");
}

// ============================================================================
// SECTION B: AGREEMENT
// ============================================================================

/**
 * @test Agreement::AllStrategiesSeeSameSequence
 * @brief On an ordered index range every strategy yields 0..n-1 in order
 *
 * @given Identity sources of several lengths, including 0 and 1
 * @when Collecting with each strategy
 * @then Every result equals iota(n)
 */
TEST_CASE("B1: Agreement::AllStrategiesSeeSameSequence", "[decomposition][agreement]")
{
    for (std::size_t n : { 0u, 1u, 2u, 3u, 7u, 64u, 1000u }) {
        const auto expected = iota(n);
        for (Strategy s : allStrategies()) {
            auto source = identitySource(n);
            INFO("n=" << n << " strategy=" << s);
            REQUIRE(collect(s, *source) == expected);
            REQUIRE(source->estimateSize() == 0);
        }
    }
}

TEST_CASE("B2: Agreement::SquaresScenario", "[decomposition][agreement]")
{
    const std::vector<int> squares{ 0, 1, 4, 9, 16 };
    for (Strategy s : allStrategies()) {
        auto source = indexed<int>(5, [](std::size_t i) { return static_cast<int>(i * i); });
        REQUIRE(collect(s, *source) == squares);
    }
}

TEST_CASE("B3: Agreement::SingletonUnderEveryStrategy", "[decomposition][agreement]")
{
    for (Strategy s : allStrategies()) {
        auto source = singleton(std::string("x"));
        REQUIRE(collect(s, *source) == std::vector<std::string>{ "x" });
    }
}

TEST_CASE("B4: Agreement::DecomposeResumesPartiallyConsumedSource", "[decomposition][agreement]")
{
    auto source = identitySource(6);
    REQUIRE(source->tryAdvance([](const int&) {}));
    REQUIRE(source->tryAdvance([](const int&) {}));

    std::vector<int> seen;
    decompose<int>(Strategy::MaximumSplit, *source, [&](const int& v) { seen.push_back(v); });
    REQUIRE(seen == std::vector<int>{ 2, 3, 4, 5 });
}

// ============================================================================
// SECTION C: SPLIT TREE
// ============================================================================

TEST_CASE("C1: SplitTree::UnsplittableSourceIsOneLeaf", "[decomposition][tree]")
{
    auto one = identitySource(1);
    auto stats = splitTree(*one);
    REQUIRE(stats.leaves == 1);
    REQUIRE(stats.splits == 0);
    REQUIRE(stats.maxDepth == 0);
    REQUIRE(stats.elements == 1);

    auto empty = identitySource(0);
    stats = splitTree(*empty);
    REQUIRE(stats.leaves == 1);
    REQUIRE(stats.elements == 0);
}

/**
 * @test SplitTree::FiveElements
 * @brief [0,5) splits into {0,1},{2..4}; then {0},{1} and {2},{3,4}; then {3},{4}
 */
TEST_CASE("C2: SplitTree::FiveElements", "[decomposition][tree]")
{
    auto source = identitySource(5);
    std::vector<int> order;
    auto stats = splitTree<int>(*source, [&](const int& v) { order.push_back(v); });

    REQUIRE(stats.leaves == 5);
    REQUIRE(stats.splits == 4);
    REQUIRE(stats.maxDepth == 3);
    REQUIRE(stats.elements == 5);
    REQUIRE(order == iota(5));
}

TEST_CASE("C3: SplitTree::DepthIsLogarithmic", "[decomposition][tree]")
{
    for (std::size_t n : { 2u, 3u, 4u, 8u, 9u, 100u, 1024u, 1025u }) {
        auto source = identitySource(n);
        auto stats = splitTree(*source);
        INFO("n=" << n);
        REQUIRE(stats.leaves == n);
        REQUIRE(stats.splits == n - 1);
        REQUIRE(stats.elements == n);
        REQUIRE(stats.maxDepth <= ceilLog2(n));
    }
}

// ============================================================================
// SECTION D: ERRORS
// ============================================================================

TEST_CASE("D1: Errors::EmptyVisitorAndBadStrategy", "[decomposition][errors]")
{
    auto source = identitySource(3);
    SplitSource<int>::Visitor empty;

    for (Strategy s : allStrategies()) {
        REQUIRE_THROWS_AS(decompose<int>(s, *source, empty), std::invalid_argument);
    }
    REQUIRE(source->estimateSize() == 3);

    REQUIRE_THROWS_AS(decompose<int>(Strategy::COUNT, *source, [](const int&) {}),
        std::out_of_range);
}

TEST_CASE("D2: Errors::VisitorExceptionPropagates", "[decomposition][errors]")
{
    for (Strategy s : allStrategies()) {
        auto source = identitySource(4);
        std::vector<int> seen;
        REQUIRE_THROWS_AS(decompose<int>(s, *source, [&](const int& v) {
            seen.push_back(v);
            if (v == 2) throw std::runtime_error("stop");
        }), std::runtime_error);
        REQUIRE(seen == std::vector<int>{ 0, 1, 2 });
    }
}
