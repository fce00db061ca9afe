#pragma once
/*
===============================================================================
SPLIT SOURCE — The splittable traversal protocol
===============================================================================

OVERVIEW
--------
SplitSource<E> is a cursor over a sequence of elements that can be consumed
sequentially (tryAdvance / forEachRemaining) or decomposed by trySplit()
into independent, disjoint sub-sources. It is the data structure a parallel
scheduler consumes; no scheduling lives here.

CONTRACT
--------
• tryAdvance(visit)
      Visit exactly one remaining element and return true, or return false
      with no state change when nothing remains. Once an element has been
      selected the cursor moves past it, even if visit throws.
• forEachRemaining(visit)
      Observably identical to calling tryAdvance until it returns false.
• trySplit()
      Hand a strict prefix of the remaining elements to a new source and
      keep the suffix, or return nullptr when the remainder is not worth
      dividing. A non-null result always strictly shrinks this source.
• estimateSize()
      Upper bound on the remaining count; exact iff Sized is declared.
• characteristics()
      Constant for the object's lifetime.
• comparator()
      Only meaningful when Sorted is declared. An empty optional means
      natural ordering (operator<).

OWNERSHIP
---------
Sources are move-only. trySplit() returns a std::unique_ptr that owns the
prefix outright; parent and child never share mutable state, so after a
split they may be driven on different threads without locking, provided
the backing storage is immutable or safe for concurrent reads.

A single source is NOT internally synchronized: never call its cursor
operations from two threads at once.

ERRORS
------
• std::invalid_argument — empty visit function
• std::runtime_error    — comparator() on a source that is not Sorted
Any exception thrown by the visit function propagates to the caller.

===============================================================================
*/

#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "characteristics.h"

namespace splitkit {

    namespace detail {

        [[noreturn]] inline void throwNullVisitor(std::string_view where) {
            throw std::invalid_argument(std::format("{}: visit function is empty", where));
        }

        [[noreturn]] inline void throwNotSorted(std::string_view where, Characteristics declared) {
            throw std::runtime_error(std::format(
                "{}: comparator requested but SORTED is not declared (declared {})",
                where, declared.toString()));
        }

        /// Runs a callable on scope exit, including unwinding
        template<typename F>
        class ScopeExit {
        public:
            explicit ScopeExit(F fn) : fn_(std::move(fn)) {}
            ScopeExit(const ScopeExit&) = delete;
            ScopeExit& operator=(const ScopeExit&) = delete;
            ~ScopeExit() { fn_(); }

        private:
            F fn_;
        };

    } // namespace detail

    /**
     * @class SplitSource
     * @brief Abstract splittable cursor over elements of type E
     *
     * @tparam E Element type. Nullable element types (std::optional<T>,
     *           pointers) are allowed; such sources must not declare NonNull.
     */
    template<typename E>
    class SplitSource {
    public:
        using value_type = E;
        using Visitor    = std::function<void(const E&)>;
        /// Strict-weak "less than" ordering
        using Comparator = std::function<bool(const E&, const E&)>;
        using size_type  = std::uint64_t;

        SplitSource() = default;
        virtual ~SplitSource() = default;

        SplitSource(const SplitSource&) = delete;
        SplitSource& operator=(const SplitSource&) = delete;
        SplitSource(SplitSource&&) = default;
        SplitSource& operator=(SplitSource&&) = default;

        // ------------------------------------------------------------------------
        // Traversal
        // ------------------------------------------------------------------------

        /**
         * @brief Visit the next element, if any
         * @return true if an element was visited
         * @throws std::invalid_argument if visit is empty
         */
        virtual bool tryAdvance(const Visitor& visit) = 0;

        /**
         * @brief Visit every remaining element in order
         * @details Default implementation loops tryAdvance(); overrides must
         *          be observably identical.
         * @throws std::invalid_argument if visit is empty
         */
        virtual void forEachRemaining(const Visitor& visit) {
            if (!visit) detail::throwNullVisitor("SplitSource::forEachRemaining");
            while (tryAdvance(visit)) {
            }
        }

        // ------------------------------------------------------------------------
        // Decomposition
        // ------------------------------------------------------------------------

        /// @brief Split off a prefix of the remaining elements, or nullptr
        [[nodiscard]] virtual std::unique_ptr<SplitSource> trySplit() = 0;

        // ------------------------------------------------------------------------
        // Metadata
        // ------------------------------------------------------------------------

        [[nodiscard]] virtual size_type estimateSize() const = 0;

        [[nodiscard]] virtual Characteristics characteristics() const noexcept = 0;

        /**
         * @brief Ordering relation of a Sorted source
         * @return the comparator, or an empty optional for natural ordering
         * @throws std::runtime_error if Sorted is not declared
         */
        [[nodiscard]] virtual std::optional<Comparator> comparator() const {
            detail::throwNotSorted("SplitSource::comparator", characteristics());
        }

        /// @brief True if every flag in `required` is declared
        [[nodiscard]] bool hasCharacteristics(Characteristics required) const noexcept {
            return characteristics().containsAll(required);
        }

        /// @brief estimateSize() when Sized is declared, otherwise empty
        [[nodiscard]] std::optional<size_type> exactSizeIfKnown() const {
            if (hasCharacteristics(Characteristic::Sized)) {
                return estimateSize();
            }
            return std::nullopt;
        }
    };

    template<typename E>
    using SplitSourcePtr = std::unique_ptr<SplitSource<E>>;

} // namespace splitkit
