#pragma once
/*
===============================================================================
DECOMPOSITION — Fixed algorithms for draining a split source
===============================================================================

OVERVIEW
--------
Three ways of consuming a SplitSource. For any conforming source they all
visit the same elements, and in the same order when the source is Ordered.
The conformance harness relies on exactly that; the strategies are also
usable on their own.

STRATEGIES
----------
• BulkDrain     — one forEachRemaining() on the untouched source
• StepAdvance   — tryAdvance() until it returns false
• MaximumSplit  — trySplit() until it returns nullptr, recursing depth-first
                  into each prefix as it is produced, then forEachRemaining()
                  on what is left. Prefixes are visited before the shrunk
                  parent, i.e. left to right for index ranges.

The set is closed, so dispatch goes through an enum-indexed function table
rather than virtual calls.

USAGE
-----
    auto src = splitkit::indexed<int>(5, [](std::size_t i) { return int(i * i); });
    std::vector<int> out = splitkit::collect(splitkit::Strategy::MaximumSplit, *src);
    // out == {0, 1, 4, 9, 16}

    for (auto s : splitkit::allStrategies()) {
        std::cout << splitkit::strategyName(s) << "\n";
    }

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <string_view>
#include <vector>

#include "enum_utils.h"
#include "split_source.h"

namespace splitkit {

    SPLITKIT_DECLARE_ENUM_WITH_COUNT(Strategy, BulkDrain, StepAdvance, MaximumSplit);

    constexpr std::string_view strategyName(Strategy s) noexcept {
        constexpr EnumTable<Strategy, std::string_view> names{{
            "bulkDrain", "stepAdvance", "maximumSplit"
        }};
        return is_valid_enum_value(s) ? names[s] : std::string_view{ "unknown" };
    }

    inline std::ostream& operator<<(std::ostream& os, Strategy s) {
        return os << strategyName(s);
    }

    /// @brief Every strategy in declaration order
    constexpr auto allStrategies() noexcept {
        return enum_values<Strategy>();
    }

    namespace detail {

        template<typename E>
        void bulkDrain(SplitSource<E>& source, const typename SplitSource<E>::Visitor& visit) {
            source.forEachRemaining(visit);
        }

        template<typename E>
        void stepAdvance(SplitSource<E>& source, const typename SplitSource<E>::Visitor& visit) {
            while (source.tryAdvance(visit)) {
            }
        }

        template<typename E>
        void maximumSplit(SplitSource<E>& source, const typename SplitSource<E>::Visitor& visit) {
            for (auto prefix = source.trySplit(); prefix; prefix = source.trySplit()) {
                maximumSplit(*prefix, visit);
            }
            source.forEachRemaining(visit);
        }

        template<typename E>
        using StrategyFn = void (*)(SplitSource<E>&, const typename SplitSource<E>::Visitor&);

        template<typename E>
        inline constexpr EnumTable<Strategy, StrategyFn<E>> kStrategies{{
            &bulkDrain<E>, &stepAdvance<E>, &maximumSplit<E>
        }};

    } // namespace detail

    /**
     * @brief Drain `source` with `strategy`, visiting every remaining element
     * @throws std::invalid_argument if visit is empty
     * @throws std::out_of_range if strategy is not a valid enumerator
     */
    template<typename E>
    void decompose(Strategy strategy, SplitSource<E>& source, const typename SplitSource<E>::Visitor& visit) {
        if (!visit) detail::throwNullVisitor("decompose");
        detail::kStrategies<E>.at(strategy)(source, visit);
    }

    /// @brief Drain `source` with `strategy` into a vector, in visit order
    template<typename E>
    std::vector<E> collect(Strategy strategy, SplitSource<E>& source) {
        std::vector<E> out;
        out.reserve(static_cast<std::size_t>(std::min<typename SplitSource<E>::size_type>(
            source.estimateSize(), 1u << 16)));
        decompose<E>(strategy, source, [&out](const E& e) { out.push_back(e); });
        return out;
    }

    // ============================================================================
    // SPLIT TREE INSPECTION
    // ============================================================================

    /**
     * @brief Shape of the tree built by splitting a source to exhaustion
     *
     * @details Depth counts split levels: an unsplittable source has depth 0,
     *          a source split once whose halves are both unsplittable has
     *          depth 1.
     */
    struct SplitStats {
        std::size_t leaves = 0;      ///< Sources left after splitting stopped
        std::size_t splits = 0;      ///< Successful trySplit() calls
        std::size_t maxDepth = 0;    ///< Deepest split level reached
        std::size_t elements = 0;    ///< Elements drained from the leaves
    };

    namespace detail {

        template<typename E>
        void walkSplits(SplitSource<E>& source, std::size_t depth, SplitStats& stats,
            const typename SplitSource<E>::Visitor& visit) {
            std::size_t level = depth;
            for (auto prefix = source.trySplit(); prefix; prefix = source.trySplit()) {
                ++stats.splits;
                ++level;
                stats.maxDepth = std::max(stats.maxDepth, level);
                walkSplits(*prefix, level, stats, visit);
            }
            ++stats.leaves;
            source.forEachRemaining([&](const E& e) {
                ++stats.elements;
                if (visit) visit(e);
            });
        }

    } // namespace detail

    /**
     * @brief Split `source` like MaximumSplit does and report the tree shape
     * @param visit Optional; receives every drained element in visit order
     *
     * @details Each successive split of the same source is one level deeper
     *          than the last, because the remainder is itself the parent of
     *          the next split.
     */
    template<typename E>
    SplitStats splitTree(SplitSource<E>& source, const typename SplitSource<E>::Visitor& visit = {}) {
        SplitStats stats;
        detail::walkSplits(source, 0, stats, visit);
        return stats;
    }

} // namespace splitkit
