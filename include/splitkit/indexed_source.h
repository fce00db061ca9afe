#pragma once
/*
===============================================================================
INDEXED SOURCE — A split source driven by an index-to-element function
===============================================================================

OVERVIEW
--------
Covers the half-open index range [offset, length) and produces element i by
calling indexFunction(i). Any random-access producer (an array, a vector, an
arithmetic sequence) can expose itself through this one class.

KEY COMPONENTS
--------------
• splitkit::IndexedSource<E> — the source itself
• splitkit::indexed(...)     — owned source over [0, length)
• splitkit::viewOf(vector)   — owned source reading a caller-owned vector

SPLITTING
---------
trySplit() cuts at the floor midpoint mid = offset + (length - offset) / 2.
The prefix [offset, mid) moves to a new source and this source continues at
mid. A range of 0 or 1 elements is not split. Repeated splitting therefore
builds a balanced binary tree of depth at most ceil(log2(n)).

CHARACTERISTICS
---------------
SIZED and SUBSIZED are always added to whatever the caller declares: an index
range always knows its remaining count, and so do both halves of a split.
Every other flag is the caller's declaration and is passed to split-off
prefixes unchanged.

THREAD SAFETY
-------------
• Parent and prefix share only the index function and comparator, which are
  never mutated; driving them on different threads is safe if the index
  function is safe to call concurrently.

EXCEPTION SAFETY
----------------
• The offset moves past an element whether visit (or the index function)
  returns or throws, so a failing element is never retried.
• An empty index function is rejected with std::invalid_argument.

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "split_source.h"

namespace splitkit {

    template<typename E>
    class IndexedSource final : public SplitSource<E> {
    public:
        using typename SplitSource<E>::Visitor;
        using typename SplitSource<E>::Comparator;
        using typename SplitSource<E>::size_type;
        using IndexFunction = std::function<E(std::size_t)>;

        static constexpr Characteristics kAlwaysDeclared{
            Characteristic::Sized, Characteristic::Subsized
        };

        /**
         * @brief Source over [0, length)
         * @param comparator Ordering reported by comparator(); only consulted
         *                   when `characteristics` contains Sorted. Empty
         *                   means natural ordering.
         * @throws std::invalid_argument if indexFunction is empty
         */
        IndexedSource(std::size_t length, IndexFunction indexFunction,
            std::optional<Comparator> comparator, Characteristics characteristics)
            : IndexedSource(0, length, std::make_shared<const IndexFunction>(std::move(indexFunction)),
                std::make_shared<const std::optional<Comparator>>(std::move(comparator)),
                characteristics)
        {
            if (!*indexFunction_) {
                throw std::invalid_argument("IndexedSource: index function is empty");
            }
        }

        IndexedSource(std::size_t length, IndexFunction indexFunction, Characteristics characteristics)
            : IndexedSource(length, std::move(indexFunction), std::nullopt, characteristics)
        {
        }

        bool tryAdvance(const Visitor& visit) override {
            if (!visit) detail::throwNullVisitor("IndexedSource::tryAdvance");
            if (offset_ < length_) {
                detail::ScopeExit advance([this] { ++offset_; });
                visit((*indexFunction_)(offset_));
                return true;
            }
            return false;
        }

        void forEachRemaining(const Visitor& visit) override {
            if (!visit) detail::throwNullVisitor("IndexedSource::forEachRemaining");
            const IndexFunction& at = *indexFunction_;
            while (offset_ < length_) {
                detail::ScopeExit advance([this] { ++offset_; });
                visit(at(offset_));
            }
        }

        [[nodiscard]] std::unique_ptr<SplitSource<E>> trySplit() override {
            const std::size_t mid = offset_ + (length_ - offset_) / 2;
            if (offset_ >= mid) {
                return nullptr;
            }
            std::unique_ptr<SplitSource<E>> prefix(
                new IndexedSource(offset_, mid, indexFunction_, comparator_, characteristics_));
            offset_ = mid;
            return prefix;
        }

        [[nodiscard]] size_type estimateSize() const override {
            return static_cast<size_type>(length_ - offset_);
        }

        [[nodiscard]] Characteristics characteristics() const noexcept override {
            return characteristics_;
        }

        [[nodiscard]] std::optional<Comparator> comparator() const override {
            if (!characteristics_.contains(Characteristic::Sorted)) {
                detail::throwNotSorted("IndexedSource::comparator", characteristics_);
            }
            return *comparator_;
        }

        /// @brief Next index to be visited
        [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

        /// @brief Exclusive upper bound of the covered range
        [[nodiscard]] std::size_t length() const noexcept { return length_; }

    private:
        // Used for split-off prefixes; shares the immutable callables.
        IndexedSource(std::size_t offset, std::size_t length,
            std::shared_ptr<const IndexFunction> indexFunction,
            std::shared_ptr<const std::optional<Comparator>> comparator,
            Characteristics characteristics)
            : offset_(offset)
            , length_(length)
            , indexFunction_(std::move(indexFunction))
            , comparator_(std::move(comparator))
            , characteristics_(characteristics | kAlwaysDeclared)
        {
        }

        std::size_t offset_;
        const std::size_t length_;
        std::shared_ptr<const IndexFunction> indexFunction_;
        std::shared_ptr<const std::optional<Comparator>> comparator_;
        const Characteristics characteristics_;
    };

    // ============================================================================
    // FACTORIES
    // ============================================================================

    /**
     * @brief Owned IndexedSource over [0, length)
     *
     * @example
     *   auto squares = splitkit::indexed<int>(5,
     *       [](std::size_t i) { return static_cast<int>(i * i); },
     *       splitkit::Characteristic::Ordered);
     */
    template<typename E, typename Fn>
    SplitSourcePtr<E> indexed(std::size_t length, Fn&& indexFunction, Characteristics characteristics = {}) {
        return std::make_unique<IndexedSource<E>>(
            length, typename IndexedSource<E>::IndexFunction(std::forward<Fn>(indexFunction)),
            characteristics);
    }

    /// @brief Owned Sorted-capable IndexedSource with an explicit comparator
    template<typename E, typename Fn, typename Cmp>
    SplitSourcePtr<E> indexed(std::size_t length, Fn&& indexFunction, Cmp&& comparator,
        Characteristics characteristics) {
        return std::make_unique<IndexedSource<E>>(
            length, typename IndexedSource<E>::IndexFunction(std::forward<Fn>(indexFunction)),
            typename SplitSource<E>::Comparator(std::forward<Cmp>(comparator)),
            characteristics);
    }

    /**
     * @brief Source reading the elements of a caller-owned vector in order
     *
     * @details The vector is captured by reference and must outlive the
     *          source and everything split from it. Ordered is always
     *          declared; add Immutable only if the vector will not change.
     */
    template<typename E>
    SplitSourcePtr<E> viewOf(const std::vector<E>& elements, Characteristics characteristics = {}) {
        const std::vector<E>* data = &elements;
        return indexed<E>(elements.size(),
            [data](std::size_t i) { return (*data)[i]; },
            characteristics | Characteristic::Ordered);
    }

} // namespace splitkit
