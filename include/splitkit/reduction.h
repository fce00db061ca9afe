#pragma once
/*
===============================================================================
REDUCTION — Merge-order tester for split-friendly reductions
===============================================================================

OVERVIEW
--------
A reduction that is fed by split sources sees its input in pieces: each
piece is accumulated separately and the partial results are combined. For
that to be safe, combining must be associative and agree with sequential
accumulation. ReductionTester checks exactly that on concrete inputs by
reducing them under several merge schemes and requiring the same result.

KEY COMPONENTS
--------------
• Reducer<T, A, R>      — supplier / accumulator / combiner / finisher
• MergeScheme           — Sequential, MergeLeftAssociative, MergeRightAssociative
• ReductionTester<T,A,R>— expectReduces(expected, inputs) → report

MERGE SCHEMES
-------------
• Sequential             one accumulator, every input accumulated in order
• MergeLeftAssociative   one accumulator per input, folded left to right
                         onto a fresh accumulator:  ((e + a) + b) + c
• MergeRightAssociative  one accumulator per input plus a trailing fresh one,
                         folded right to left:      a + (b + (c + e))

When the reducer declares identityFinish, the raw accumulator must already
equal the expected result, in addition to the finished one.

USAGE
-----
    splitkit::Reducer<int, long, long> sum{
        [] { return 0L; },
        [](long& acc, const int& v) { acc += v; },
        [](long a, long b) { return a + b; },
        [](long a) { return a; },
        true
    };

    auto report = splitkit::ReductionTester<int, long, long>(sum)
        .expectReduces(6, { 1, 2, 3 })
        .expectReduces(0, {})
        .report();

===============================================================================
*/

#include <concepts>
#include <cstddef>
#include <exception>
#include <format>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.h"
#include "enum_utils.h"
#include "report.h"

namespace splitkit {

    SPLITKIT_DECLARE_ENUM_WITH_COUNT(MergeScheme,
        Sequential, MergeLeftAssociative, MergeRightAssociative);

    constexpr std::string_view mergeSchemeName(MergeScheme m) noexcept {
        constexpr EnumTable<MergeScheme, std::string_view> names{{
            "sequential", "mergeLeftAssociative", "mergeRightAssociative"
        }};
        return is_valid_enum_value(m) ? names[m] : std::string_view{ "unknown" };
    }

    /**
     * @struct Reducer
     * @brief A mutable reduction described by four functions
     *
     * @tparam T Input element type
     * @tparam A Accumulator type
     * @tparam R Result type
     */
    template<typename T, typename A, typename R>
    struct Reducer {
        std::function<A()> supplier;
        std::function<void(A&, const T&)> accumulator;
        std::function<A(A, A)> combiner;
        std::function<R(A)> finisher;
        /// The finisher is the identity: the accumulator is already the result
        bool identityFinish = false;
    };

    namespace detail {

        template<typename T, typename A, typename R>
        A reduceSequential(const Reducer<T, A, R>& r, const std::vector<T>& inputs) {
            A acc = r.supplier();
            for (const T& input : inputs) {
                r.accumulator(acc, input);
            }
            return acc;
        }

        template<typename T, typename A, typename R>
        A reduceLeft(const Reducer<T, A, R>& r, const std::vector<T>& inputs) {
            A acc = r.supplier();
            for (const T& input : inputs) {
                A next = r.supplier();
                r.accumulator(next, input);
                acc = r.combiner(std::move(acc), std::move(next));
            }
            return acc;
        }

        template<typename T, typename A, typename R>
        A reduceRight(const Reducer<T, A, R>& r, const std::vector<T>& inputs) {
            std::vector<A> stack;
            stack.reserve(inputs.size() + 1);
            for (const T& input : inputs) {
                A next = r.supplier();
                r.accumulator(next, input);
                stack.push_back(std::move(next));
            }
            stack.push_back(r.supplier());
            while (stack.size() > 1) {
                A right = std::move(stack.back());
                stack.pop_back();
                A left = std::move(stack.back());
                stack.pop_back();
                stack.push_back(r.combiner(std::move(left), std::move(right)));
            }
            return std::move(stack.back());
        }

        template<typename T, typename A, typename R>
        using SchemeFn = A (*)(const Reducer<T, A, R>&, const std::vector<T>&);

        template<typename T, typename A, typename R>
        inline constexpr EnumTable<MergeScheme, SchemeFn<T, A, R>> kSchemes{{
            &reduceSequential<T, A, R>, &reduceLeft<T, A, R>, &reduceRight<T, A, R>
        }};

    } // namespace detail

    /// @brief Reduce `inputs` with `r` under `scheme`, returning the raw accumulator
    template<typename T, typename A, typename R>
    A reduceWith(MergeScheme scheme, const Reducer<T, A, R>& r, const std::vector<T>& inputs) {
        return detail::kSchemes<T, A, R>.at(scheme)(r, inputs);
    }

    /**
     * @class ReductionTester
     * @brief Checks that a Reducer gives the same result under every merge scheme
     *
     * @details Failures are collected, not thrown; call report() (and
     *          throwIfFailed() on it, if desired) when done.
     */
    template<typename T, typename A, typename R>
    class ReductionTester {
    public:
        using Equivalence = std::function<bool(const R&, const R&)>;

        /**
         * @param equivalence Result comparison; defaults to operator==
         * @throws std::invalid_argument if any reducer function is empty, or
         *         if no equivalence is given and R has no operator==
         */
        explicit ReductionTester(Reducer<T, A, R> reducer, Equivalence equivalence = {},
            HarnessOptions options = {})
            : reducer_(std::move(reducer))
            , equivalence_(std::move(equivalence))
            , options_(std::move(options))
        {
            if (!reducer_.supplier || !reducer_.accumulator || !reducer_.combiner || !reducer_.finisher) {
                throw std::invalid_argument("ReductionTester: reducer has an empty function");
            }
            if (!equivalence_) {
                if constexpr (std::equality_comparable<R>) {
                    equivalence_ = [](const R& a, const R& b) { return a == b; };
                }
                else {
                    throw std::invalid_argument(
                        "ReductionTester: result type has no operator==, pass an equivalence");
                }
            }
        }

        /// @brief Require every scheme to reduce `inputs` to `expected`
        ReductionTester& expectReduces(const R& expected, const std::vector<T>& inputs) {
            ++cases_;
            const std::string check = std::format("reduces#{}", cases_);
            const std::size_t before = report_.violations().size();

            for (MergeScheme scheme : enum_values<MergeScheme>()) {
                const std::string_view name = mergeSchemeName(scheme);
                try {
                    A accumulated = reduceWith(scheme, reducer_, inputs);
                    if (reducer_.identityFinish) {
                        if constexpr (std::is_convertible_v<A, R>) {
                            compare(check, name, "unfinished accumulator", expected, R(accumulated), inputs);
                        }
                    }
                    compare(check, name, "finished result", expected, reducer_.finisher(std::move(accumulated)), inputs);
                }
                catch (const std::exception& e) {
                    fail(check, name, std::format("reduction threw: {}", e.what()));
                }
            }

            if (report_.violations().size() == before) {
                detail::logOutcome(options_, check, {}, "pass");
                report_.addPass(check);
            }
            return *this;
        }

        [[nodiscard]] const ConformanceReport& report() const noexcept { return report_; }

    private:
        void compare(const std::string& check, std::string_view scheme, std::string_view what,
            const R& expected, const R& actual, const std::vector<T>& inputs) {
            if (!equivalence_(expected, actual)) {
                fail(check, scheme, std::format("{} {} differs from expected {} for inputs {}",
                    what, describe(actual), describe(expected),
                    describe(inputs, options_.maxEchoedElements)));
            }
        }

        void fail(const std::string& check, std::string_view scheme, std::string message) {
            detail::logOutcome(options_, check, scheme, "FAIL", message);
            report_.addViolation(Violation{ check, std::string(scheme), std::move(message) });
        }

        Reducer<T, A, R> reducer_;
        Equivalence equivalence_;
        HarnessOptions options_;
        ConformanceReport report_;
        std::size_t cases_ = 0;
    };

} // namespace splitkit
