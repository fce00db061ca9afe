#pragma once
/*
===============================================================================
CONFORMANCE — Test driver for split source implementations
===============================================================================

OVERVIEW
--------
trySplit() has no directly observable contract beyond "splitting, however
often, yields the same traversal as not splitting at all". The conformance
harness turns that into checks: it drains a fresh source from the producer
with every decomposition strategy and cross-checks the results against the
producer's expected elements, its exact size, and the source's declared
characteristics.

CHECKS
------
Name                        Gate                              Asserts
--------------------------  --------------------------------  ---------------------------------------
elements                    always                            every strategy visits the expected
                                                              multiset exactly once each
knownOrder                  source declares ORDERED           every strategy visits orderedElements()
                                                              in that exact order
comparator                  always                            SORTED: each strategy's sequence is
                                                              non-decreasing under comparator() or
                                                              operator<; otherwise comparator() throws
                                                              std::runtime_error
estimateSize                source declares SIZED             estimateSize() == exactSizeIfKnown() ==
                                                              size(); with SUBSIZED, prefix + rest
                                                              after one split == pre-split estimate
nullable                    ALLOWS_NULL_VALUES, size != ZERO  NONNULL not declared
notImmutableAllowsAdd       SUPPORTS_ADD                      IMMUTABLE not declared
notImmutableAllowsRemove    SUPPORTS_REMOVE                   IMMUTABLE not declared

Registration gates live in CheckRegistry; characteristic gates are decided
inside the check and reported as skips.

REPORTING
---------
Nothing here throws on a failed check. Every failure becomes a Violation in
the returned ConformanceReport naming the check, the strategy, and the
expected vs actual data. Exceptions escaping a producer or source during a
check are recorded as violations of that check as well.

USAGE
-----
    splitkit::VectorProducer<int> producer({ 3, 1, 2 }, {},
        [](const auto& v) { return splitkit::viewOf(v, splitkit::Characteristic::Immutable); });

    splitkit::ConformanceHarness<int> harness;
    auto report = harness.run(producer);
    if (!report.ok()) std::cerr << report << "\n";

THREAD SAFETY
-------------
• Strategies run one after another, each on its own fresh source
• A harness is immutable during run(); concurrent runs on distinct producers
  are safe as long as each producer is

===============================================================================
*/

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <exception>
#include <format>
#include <functional>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "collection_features.h"
#include "config.h"
#include "decomposition.h"
#include "report.h"
#include "split_source.h"

namespace splitkit {

    // ============================================================================
    // CHECK CONTEXT
    // ============================================================================
    /**
     * @class CheckContext
     * @brief What a single check sees while it runs
     */
    template<typename E>
    class CheckContext {
    public:
        CheckContext(const SourceProducer<E>& producer, const HarnessOptions& options,
            ConformanceReport& report, std::string_view check)
            : producer_(producer)
            , options_(options)
            , report_(report)
            , check_(check)
        {
        }

        [[nodiscard]] const SourceProducer<E>& producer() const noexcept { return producer_; }
        [[nodiscard]] const HarnessOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::string_view check() const noexcept { return check_; }

        /// @brief Record a violation of the running check
        void fail(std::string_view strategy, std::string message) {
            ++failures_;
            detail::logOutcome(options_, check_, strategy, "FAIL", message);
            report_.addViolation(Violation{
                std::string(check_),
                strategy.empty() ? std::string("-") : std::string(strategy),
                std::move(message) });
        }

        /// @brief Mark the running check as not applicable
        void skip(std::string reason) {
            skipped_ = true;
            skipReason_ = std::move(reason);
        }

        /// @brief True when failFast is on and this check already failed
        [[nodiscard]] bool shouldStop() const noexcept {
            return options_.failFast && failures_ > 0;
        }

        [[nodiscard]] std::size_t failures() const noexcept { return failures_; }
        [[nodiscard]] bool skipped() const noexcept { return skipped_; }
        [[nodiscard]] const std::string& skipReason() const noexcept { return skipReason_; }

        /// @brief Render a sequence with the configured echo limit
        [[nodiscard]] std::string show(const std::vector<E>& values) const {
            return describe(values, options_.maxEchoedElements);
        }

    private:
        const SourceProducer<E>& producer_;
        const HarnessOptions& options_;
        ConformanceReport& report_;
        std::string_view check_;
        std::size_t failures_ = 0;
        bool skipped_ = false;
        std::string skipReason_;
    };

    // ============================================================================
    // CHECK REGISTRY
    // ============================================================================
    /**
     * @class CheckRegistry
     * @brief Ordered table of checks, each gated on producer features and size
     *
     * @details A check runs only if the producer declares every feature in
     *          `required` and its size bucket is not listed in `absentSizes`.
     */
    template<typename E>
    class CheckRegistry {
    public:
        using CheckFn = std::function<void(CheckContext<E>&)>;

        struct Entry {
            std::string name;
            FeatureSet required;
            std::vector<CollectionSize> absentSizes;
            CheckFn run;

            [[nodiscard]] bool enabledFor(const SourceProducer<E>& producer) const {
                if (!producer.features().containsAll(required)) return false;
                const CollectionSize size = producer.collectionSize();
                return std::find(absentSizes.begin(), absentSizes.end(), size) == absentSizes.end();
            }

            /// @brief Why the gate rejected `producer`; empty if it did not
            [[nodiscard]] std::string gateReason(const SourceProducer<E>& producer) const {
                if (!producer.features().containsAll(required)) {
                    std::ostringstream os;
                    os << "requires " << required << ", producer declares " << producer.features();
                    return os.str();
                }
                const CollectionSize size = producer.collectionSize();
                if (std::find(absentSizes.begin(), absentSizes.end(), size) != absentSizes.end()) {
                    return std::format("not applicable to collection size {}", sizeName(size));
                }
                return {};
            }
        };

        /**
         * @brief Append a check
         * @throws std::invalid_argument on an empty name, a duplicate name or
         *         an empty check function
         */
        CheckRegistry& add(std::string name, FeatureSet required, std::vector<CollectionSize> absentSizes,
            CheckFn run) {
            if (name.empty()) {
                throw std::invalid_argument("CheckRegistry::add: empty check name");
            }
            if (!run) {
                throw std::invalid_argument(std::format("CheckRegistry::add: check '{}' has no function", name));
            }
            if (find(name) != nullptr) {
                throw std::invalid_argument(std::format("CheckRegistry::add: duplicate check '{}'", name));
            }
            entries_.push_back(Entry{ std::move(name), required, std::move(absentSizes), std::move(run) });
            return *this;
        }

        CheckRegistry& add(std::string name, CheckFn run) {
            return add(std::move(name), {}, {}, std::move(run));
        }

        /// @brief Drop a check by name; returns false if it was not registered
        bool remove(std::string_view name) {
            auto it = std::find_if(entries_.begin(), entries_.end(),
                [&](const Entry& e) { return e.name == name; });
            if (it == entries_.end()) return false;
            entries_.erase(it);
            return true;
        }

        [[nodiscard]] const Entry* find(std::string_view name) const {
            for (const auto& e : entries_) {
                if (e.name == name) return &e;
            }
            return nullptr;
        }

        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> out;
            out.reserve(entries_.size());
            for (const auto& e : entries_) out.push_back(e.name);
            return out;
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

    private:
        std::vector<Entry> entries_;
    };

    // ============================================================================
    // STANDARD CHECKS
    // ============================================================================

    namespace checks {

        /// Elements of `expected` not matched in `actual`, and the leftovers of `actual`
        template<typename E>
        std::pair<std::vector<E>, std::vector<E>> multisetDifference(
            const std::vector<E>& expected, std::vector<E> actual) {
            std::vector<E> missing;
            for (const E& e : expected) {
                auto it = std::find(actual.begin(), actual.end(), e);
                if (it == actual.end()) {
                    missing.push_back(e);
                }
                else {
                    actual.erase(it);
                }
            }
            return { std::move(missing), std::move(actual) };
        }

        template<typename E>
        void elements(CheckContext<E>& ctx) {
            const std::vector<E> expected = ctx.producer().sampleElements();
            for (Strategy s : ctx.options().strategies) {
                auto source = ctx.producer().source();
                const std::vector<E> actual = collect(s, *source);
                auto [missing, unexpected] = multisetDifference(expected, actual);
                if (!missing.empty() || !unexpected.empty()) {
                    ctx.fail(strategyName(s), std::format(
                        "expected {} in any order, got {}; missing {}, unexpected {}",
                        ctx.show(expected), ctx.show(actual), ctx.show(missing), ctx.show(unexpected)));
                }
                if (ctx.shouldStop()) return;
            }
        }

        template<typename E>
        void knownOrder(CheckContext<E>& ctx) {
            if (!ctx.producer().source()->hasCharacteristics(Characteristic::Ordered)) {
                ctx.skip("source does not declare ORDERED");
                return;
            }
            const std::vector<E> expected = ctx.producer().orderedElements();
            for (Strategy s : ctx.options().strategies) {
                auto source = ctx.producer().source();
                const std::vector<E> actual = collect(s, *source);
                if (actual != expected) {
                    const auto mismatch = std::mismatch(expected.begin(), expected.end(),
                        actual.begin(), actual.end());
                    ctx.fail(strategyName(s), std::format(
                        "expected {} in order, got {}; first difference at position {}",
                        ctx.show(expected), ctx.show(actual),
                        static_cast<std::size_t>(mismatch.first - expected.begin())));
                }
                if (ctx.shouldStop()) return;
            }
        }

        template<typename E>
        void comparatorOrdering(CheckContext<E>& ctx) {
            using Comparator = typename SplitSource<E>::Comparator;

            if (!ctx.producer().source()->hasCharacteristics(Characteristic::Sorted)) {
                auto source = ctx.producer().source();
                try {
                    (void)source->comparator();
                    ctx.fail({}, std::format(
                        "comparator() returned although SORTED is not declared (declared {})",
                        source->characteristics().toString()));
                }
                catch (const std::runtime_error&) {
                    // expected: not sorted
                }
                return;
            }

            for (Strategy s : ctx.options().strategies) {
                auto source = ctx.producer().source();
                std::optional<Comparator> declared = source->comparator();
                Comparator less;
                if (declared && *declared) {
                    less = *declared;
                }
                else if constexpr (std::totally_ordered<E>) {
                    less = [](const E& a, const E& b) { return a < b; };
                }
                else {
                    ctx.fail(strategyName(s),
                        "SORTED declared with natural ordering, but the element type has no operator<");
                    return;
                }

                const std::vector<E> actual = collect(s, *source);
                auto inversion = std::adjacent_find(actual.begin(), actual.end(),
                    [&](const E& a, const E& b) { return less(b, a); });
                if (inversion != actual.end()) {
                    const auto at = static_cast<std::size_t>(inversion - actual.begin());
                    ctx.fail(strategyName(s), std::format(
                        "sequence {} is not ordered under the declared comparator: {} precedes {} at position {}",
                        ctx.show(actual), describe(*inversion), describe(*(inversion + 1)), at));
                }
                if (ctx.shouldStop()) return;
            }
        }

        template<typename E>
        void estimateSize(CheckContext<E>& ctx) {
            auto source = ctx.producer().source();
            if (!source->hasCharacteristics(Characteristic::Sized)) {
                ctx.skip("source does not declare SIZED");
                return;
            }
            const auto expected = static_cast<typename SplitSource<E>::size_type>(ctx.producer().size());
            const auto before = source->estimateSize();
            if (before != expected) {
                ctx.fail({}, std::format("SIZED source estimates {} elements, collection holds {}",
                    before, expected));
            }
            const auto exact = source->exactSizeIfKnown();
            if (!exact || *exact != expected) {
                ctx.fail({}, std::format("exactSizeIfKnown() is {}, collection holds {}",
                    exact ? std::to_string(*exact) : std::string("unknown"), expected));
            }
            if (ctx.shouldStop()) return;

            if (source->hasCharacteristics(Characteristic::Subsized)) {
                auto part = source->trySplit();
                const auto partSize = part ? part->estimateSize() : 0;
                const auto rest = source->estimateSize();
                if (partSize + rest != before) {
                    ctx.fail({}, std::format(
                        "SUBSIZED split does not preserve size: prefix {} + remainder {} = {}, expected {}",
                        partSize, rest, partSize + rest, before));
                }
            }
        }

        template<typename E>
        void nullable(CheckContext<E>& ctx) {
            auto source = ctx.producer().source();
            if (source->hasCharacteristics(Characteristic::NonNull)) {
                ctx.fail({}, std::format(
                    "collection allows null values but its source declares NONNULL ({})",
                    source->characteristics().toString()));
            }
        }

        template<typename E>
        void notImmutable(CheckContext<E>& ctx, std::string_view operation) {
            auto source = ctx.producer().source();
            if (source->hasCharacteristics(Characteristic::Immutable)) {
                ctx.fail({}, std::format(
                    "collection supports {} but its source declares IMMUTABLE ({})",
                    operation, source->characteristics().toString()));
            }
        }

    } // namespace checks

    /// @brief The standard check table, in the order the harness runs it
    template<typename E>
    CheckRegistry<E> standardChecks() {
        CheckRegistry<E> registry;
        registry.add("elements", &checks::elements<E>);
        registry.add("knownOrder", &checks::knownOrder<E>);
        registry.add("comparator", &checks::comparatorOrdering<E>);
        registry.add("estimateSize", &checks::estimateSize<E>);
        registry.add("nullable",
            { CollectionFeature::AllowsNullValues }, { CollectionSize::Zero },
            &checks::nullable<E>);
        registry.add("notImmutableAllowsAdd", { CollectionFeature::SupportsAdd }, {},
            [](CheckContext<E>& ctx) { checks::notImmutable(ctx, "add"); });
        registry.add("notImmutableAllowsRemove", { CollectionFeature::SupportsRemove }, {},
            [](CheckContext<E>& ctx) { checks::notImmutable(ctx, "remove"); });
        return registry;
    }

    // ============================================================================
    // HARNESS
    // ============================================================================
    /**
     * @class ConformanceHarness
     * @brief Runs a CheckRegistry against a producer and reports the outcome
     *
     * @tparam E Element type; must be equality comparable so visited
     *           multisets can be compared with the expected ones
     */
    template<typename E>
    class ConformanceHarness {
        static_assert(std::equality_comparable<E>,
            "ConformanceHarness: element type must be equality comparable");

    public:
        explicit ConformanceHarness(HarnessOptions options = {})
            : options_(std::move(options))
            , registry_(standardChecks<E>())
        {
        }

        ConformanceHarness(HarnessOptions options, CheckRegistry<E> registry)
            : options_(std::move(options))
            , registry_(std::move(registry))
        {
        }

        [[nodiscard]] const HarnessOptions& options() const noexcept { return options_; }
        [[nodiscard]] HarnessOptions& options() noexcept { return options_; }

        [[nodiscard]] const CheckRegistry<E>& registry() const noexcept { return registry_; }
        [[nodiscard]] CheckRegistry<E>& registry() noexcept { return registry_; }

        /// @brief Run every enabled check against `producer`
        [[nodiscard]] ConformanceReport run(const SourceProducer<E>& producer) const {
            ConformanceReport report;
            for (const auto& entry : registry_) {
                runEntry(entry, producer, report);
                if (options_.failFast && !report.ok()) break;
            }
            return report;
        }

        /**
         * @brief Run a single registered check
         * @throws std::invalid_argument if no check named `name` is registered
         */
        [[nodiscard]] ConformanceReport runCheck(std::string_view name, const SourceProducer<E>& producer) const {
            const auto* entry = registry_.find(name);
            if (entry == nullptr) {
                throw std::invalid_argument(std::format("ConformanceHarness::runCheck: no check named '{}'", name));
            }
            ConformanceReport report;
            runEntry(*entry, producer, report);
            return report;
        }

    private:
        void runEntry(const typename CheckRegistry<E>::Entry& entry, const SourceProducer<E>& producer,
            ConformanceReport& report) const {
            if (!entry.enabledFor(producer)) {
                std::string reason = entry.gateReason(producer);
                detail::logOutcome(options_, entry.name, {}, "skip", reason);
                report.addSkip(entry.name, std::move(reason));
                return;
            }

            CheckContext<E> ctx(producer, options_, report, entry.name);
            try {
                entry.run(ctx);
            }
            catch (const std::exception& e) {
                ctx.fail({}, std::format("check threw: {}", e.what()));
            }

            if (ctx.failures() > 0) return;
            if (ctx.skipped()) {
                detail::logOutcome(options_, entry.name, {}, "skip", ctx.skipReason());
                report.addSkip(entry.name, ctx.skipReason());
                return;
            }
            detail::logOutcome(options_, entry.name, {}, "pass");
            report.addPass(entry.name);
        }

        HarnessOptions options_;
        CheckRegistry<E> registry_;
    };

    /// @brief Run the standard checks with `options` and return the report
    template<typename E>
    ConformanceReport checkConformance(const SourceProducer<E>& producer, HarnessOptions options = {}) {
        return ConformanceHarness<E>(std::move(options)).run(producer);
    }

} // namespace splitkit
