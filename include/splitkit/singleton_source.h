#pragma once
/*
===============================================================================
SINGLETON SOURCE — A split source over at most one element
===============================================================================

OVERVIEW
--------
Holds a single value and yields it once. The value is destroyed as soon as
it has been visited; the source never needs it again. A single element is
indivisible, so trySplit() always returns nullptr.

Declared characteristics: DISTINCT | IMMUTABLE | ORDERED | SIZED | SUBSIZED.
NONNULL is never declared: the declaration must hold for every instance of
the type, and the element type may be nullable.

USAGE
-----
    auto s = splitkit::singleton(std::string("x"));
    s->estimateSize();                               // 1
    s->tryAdvance([](const std::string& v) { ... }); // true, visits "x"
    s->estimateSize();                               // 0
    s->tryAdvance([](const std::string&) {});        // false

===============================================================================
*/

#include <memory>
#include <optional>
#include <utility>

#include "split_source.h"

namespace splitkit {

    template<typename E>
    class SingletonSource final : public SplitSource<E> {
    public:
        using typename SplitSource<E>::Visitor;
        using typename SplitSource<E>::size_type;

        static constexpr Characteristics kCharacteristics{
            Characteristic::Distinct, Characteristic::Immutable, Characteristic::Ordered,
            Characteristic::Sized, Characteristic::Subsized
        };

        explicit SingletonSource(E element)
            : element_(std::move(element))
        {
        }

        bool tryAdvance(const Visitor& visit) override {
            if (!visit) detail::throwNullVisitor("SingletonSource::tryAdvance");
            if (consumed_) {
                return false;
            }
            detail::ScopeExit release([this] {
                element_.reset();
                consumed_ = true;
            });
            visit(*element_);
            return true;
        }

        void forEachRemaining(const Visitor& visit) override {
            tryAdvance(visit);
        }

        [[nodiscard]] std::unique_ptr<SplitSource<E>> trySplit() override {
            return nullptr;
        }

        [[nodiscard]] size_type estimateSize() const override {
            return consumed_ ? 0 : 1;
        }

        [[nodiscard]] Characteristics characteristics() const noexcept override {
            return kCharacteristics;
        }

        /// @brief True once the element has been handed out
        [[nodiscard]] bool consumed() const noexcept { return consumed_; }

        /// @brief True while the source still owns its element
        [[nodiscard]] bool holdsElement() const noexcept { return element_.has_value(); }

    private:
        std::optional<E> element_;
        bool consumed_ = false;
    };

    /// @brief Owned SingletonSource over `element`
    template<typename E>
    SplitSourcePtr<E> singleton(E element) {
        return std::make_unique<SingletonSource<E>>(std::move(element));
    }

} // namespace splitkit
