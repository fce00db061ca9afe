/*
===============================================================================
TEST SINGLETON SOURCE — Tests for singleton_source.h
===============================================================================

OVERVIEW
--------
Validates SingletonSource: single visit, permanent consumption, release of
the held value, fixed characteristics, and the error behavior shared with
every SplitSource (empty visit function, comparator on an unsorted source).

TEST ORGANIZATION
-----------------
• Section A: Traversal
• Section B: Splitting and size
• Section C: Characteristics and comparator
• Section D: Failure handling

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• singleton_source.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>
#include <splitkit/singleton_source.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace splitkit;

// ============================================================================
// SECTION A: TRAVERSAL
// ============================================================================

/**
 * @test Traversal::SingleVisitThenExhausted
 * @brief The "x" scenario: one visit, size 1 → 0, no split, second advance is a no-op
 *
 * @given A SingletonSource holding "x"
 * @when Advancing twice
 * @then "x" is visited exactly once and the second call returns false
 *
 * @covers SingletonSource::tryAdvance, estimateSize, trySplit
 */
TEST_CASE("A1: Traversal::SingleVisitThenExhausted", "[singleton][traversal]")
{
    SingletonSource<std::string> source("x");
    std::vector<std::string> seen;

    REQUIRE(source.estimateSize() == 1);
    REQUIRE(source.trySplit() == nullptr);

    REQUIRE(source.tryAdvance([&](const std::string& v) { seen.push_back(v); }));
    REQUIRE(seen == std::vector<std::string>{ "x" });
    REQUIRE(source.estimateSize() == 0);

    REQUIRE_FALSE(source.tryAdvance([&](const std::string& v) { seen.push_back(v); }));
    REQUIRE(seen.size() == 1);
    REQUIRE(source.trySplit() == nullptr);
}

TEST_CASE("A2: Traversal::ForEachRemainingIsOneAdvance", "[singleton][traversal]")
{
    auto source = singleton(42);
    int calls = 0;
    int value = 0;

    source->forEachRemaining([&](const int& v) { ++calls; value = v; });
    REQUIRE(calls == 1);
    REQUIRE(value == 42);

    source->forEachRemaining([&](const int&) { ++calls; });
    REQUIRE(calls == 1);
}

TEST_CASE("A3: Traversal::ReleasesValueAfterVisit", "[singleton][ownership]")
{
    auto payload = std::make_shared<int>(7);
    std::weak_ptr<int> watch = payload;

    SingletonSource<std::shared_ptr<int>> source(std::move(payload));
    REQUIRE(source.holdsElement());
    REQUIRE_FALSE(watch.expired());

    REQUIRE(source.tryAdvance([](const std::shared_ptr<int>& p) { REQUIRE(*p == 7); }));
    REQUIRE_FALSE(source.holdsElement());
    REQUIRE(source.consumed());
    REQUIRE(watch.expired());
}

TEST_CASE("A4: Traversal::NullElementIsVisited", "[singleton][nullable]")
{
    SingletonSource<std::optional<int>> source(std::nullopt);
    bool sawNull = false;
    REQUIRE(source.tryAdvance([&](const std::optional<int>& v) { sawNull = !v.has_value(); }));
    REQUIRE(sawNull);
    REQUIRE(source.estimateSize() == 0);
}

// ============================================================================
// SECTION B: CHARACTERISTICS AND COMPARATOR
// ============================================================================

TEST_CASE("B1: Characteristics::FixedDeclaration", "[singleton][characteristics]")
{
    SingletonSource<int> source(1);
    const Characteristics expected{
        Characteristic::Distinct, Characteristic::Immutable, Characteristic::Ordered,
        Characteristic::Sized, Characteristic::Subsized
    };

    REQUIRE(source.characteristics() == expected);
    REQUIRE_FALSE(source.hasCharacteristics(Characteristic::NonNull));
    REQUIRE_FALSE(source.hasCharacteristics(Characteristic::Sorted));
    REQUIRE(source.exactSizeIfKnown() == 1u);

    (void)source.tryAdvance([](const int&) {});
    REQUIRE(source.characteristics() == expected);
    REQUIRE(source.exactSizeIfKnown() == 0u);
}

TEST_CASE("B2: Comparator::NotSortedThrows", "[singleton][comparator]")
{
    SingletonSource<int> source(1);
    REQUIRE_THROWS_AS(source.comparator(), std::runtime_error);
}

// ============================================================================
// SECTION C: FAILURE HANDLING
// ============================================================================

TEST_CASE("C1: Failure::EmptyVisitorRejected", "[singleton][errors]")
{
    SingletonSource<int> source(1);
    SplitSource<int>::Visitor empty;

    REQUIRE_THROWS_AS(source.tryAdvance(empty), std::invalid_argument);
    REQUIRE_THROWS_AS(source.forEachRemaining(empty), std::invalid_argument);

    // No side effects: the element is still there
    REQUIRE(source.estimateSize() == 1);
    REQUIRE(source.holdsElement());
}

/**
 * @test Failure::ThrowingVisitorStillConsumes
 * @brief A visit that throws does not leave the element available for retry
 */
TEST_CASE("C2: Failure::ThrowingVisitorStillConsumes", "[singleton][errors]")
{
    SingletonSource<int> source(1);

    REQUIRE_THROWS_AS(source.tryAdvance([](const int&) { throw std::runtime_error("boom"); }),
        std::runtime_error);
    REQUIRE(source.consumed());
    REQUIRE_FALSE(source.holdsElement());
    REQUIRE(source.estimateSize() == 0);
    REQUIRE_FALSE(source.tryAdvance([](const int&) {}));
}
