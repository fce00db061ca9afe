#pragma once
/*
===============================================================================
COLLECTION FEATURES — What a producer tells the conformance harness
===============================================================================

OVERVIEW
--------
The harness never inspects a collection directly. A producer describes the
collection under test through SourceProducer<E>: how to bind a fresh split
source to the current contents, which elements to expect, and a few declared
features that gate the characteristic cross-checks.

KEY COMPONENTS
--------------
• CollectionFeature  — AllowsNullValues, SupportsAdd, SupportsRemove
• FeatureSet         — Value-type set of CollectionFeature
• CollectionSize     — Zero / One / Several, used for size-gated checks
• SourceProducer<E>  — Abstract producer collaborator
• VectorProducer<E>  — Concrete producer over a std::vector<E>

USAGE
-----
    std::vector<std::optional<int>> data{ 1, std::nullopt, 3 };
    splitkit::VectorProducer<std::optional<int>> producer(
        data,
        { splitkit::CollectionFeature::AllowsNullValues,
          splitkit::CollectionFeature::SupportsAdd },
        [](const auto& v) { return splitkit::viewOf(v); });

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "split_source.h"

namespace splitkit {

    SPLITKIT_DECLARE_ENUM_WITH_COUNT(CollectionFeature,
        AllowsNullValues, SupportsAdd, SupportsRemove);

    SPLITKIT_DECLARE_ENUM_WITH_COUNT(CollectionSize, Zero, One, Several);

    constexpr std::string_view featureName(CollectionFeature f) noexcept {
        constexpr EnumTable<CollectionFeature, std::string_view> names{{
            "ALLOWS_NULL_VALUES", "SUPPORTS_ADD", "SUPPORTS_REMOVE"
        }};
        return is_valid_enum_value(f) ? names[f] : std::string_view{ "UNKNOWN" };
    }

    constexpr std::string_view sizeName(CollectionSize s) noexcept {
        constexpr EnumTable<CollectionSize, std::string_view> names{{
            "ZERO", "ONE", "SEVERAL"
        }};
        return is_valid_enum_value(s) ? names[s] : std::string_view{ "UNKNOWN" };
    }

    /// @brief Size bucket of a collection holding `n` elements
    constexpr CollectionSize sizeOf(std::size_t n) noexcept {
        return n == 0 ? CollectionSize::Zero
             : n == 1 ? CollectionSize::One
                      : CollectionSize::Several;
    }

    /**
     * @class FeatureSet
     * @brief Set of CollectionFeature flags declared by a producer
     */
    class FeatureSet {
    public:
        constexpr FeatureSet() noexcept = default;

        constexpr FeatureSet(std::initializer_list<CollectionFeature> features) noexcept {
            for (CollectionFeature f : features) {
                if (is_valid_enum_value(f)) bits_ |= 1u << enum_index(f);
            }
        }

        [[nodiscard]] constexpr bool contains(CollectionFeature f) const noexcept {
            return is_valid_enum_value(f) && (bits_ & (1u << enum_index(f))) != 0;
        }

        [[nodiscard]] constexpr bool containsAll(FeatureSet other) const noexcept {
            return (bits_ & other.bits_) == other.bits_;
        }

        [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

        friend constexpr bool operator==(FeatureSet, FeatureSet) noexcept = default;

        friend std::ostream& operator<<(std::ostream& os, FeatureSet s) {
            os << '{';
            bool first = true;
            for (CollectionFeature f : enum_values<CollectionFeature>()) {
                if (!s.contains(f)) continue;
                if (!first) os << '|';
                os << featureName(f);
                first = false;
            }
            return os << '}';
        }

    private:
        unsigned bits_ = 0;
    };

    // ============================================================================
    // PRODUCER COLLABORATOR
    // ============================================================================
    /**
     * @class SourceProducer
     * @brief A collection under test, as seen by the conformance harness
     *
     * @details source() must return a new, untouched source bound to the
     *          contents at call time; the harness asks for one per strategy.
     */
    template<typename E>
    class SourceProducer {
    public:
        virtual ~SourceProducer() = default;

        /// @brief Fresh source over the current contents
        [[nodiscard]] virtual SplitSourcePtr<E> source() const = 0;

        /// @brief Elements in the collection's defined iteration order
        [[nodiscard]] virtual std::vector<E> orderedElements() const = 0;

        /// @brief Elements as a multiset; defaults to orderedElements()
        [[nodiscard]] virtual std::vector<E> sampleElements() const { return orderedElements(); }

        /// @brief Exact number of elements
        [[nodiscard]] virtual std::size_t size() const { return orderedElements().size(); }

        [[nodiscard]] virtual FeatureSet features() const = 0;

        [[nodiscard]] CollectionSize collectionSize() const { return sizeOf(size()); }
    };

    /**
     * @class VectorProducer
     * @brief SourceProducer backed by an owned std::vector<E>
     *
     * @details The source factory receives the producer's vector by const
     *          reference. Sources it builds may refer to that vector, so they
     *          must not outlive the producer.
     */
    template<typename E>
    class VectorProducer final : public SourceProducer<E> {
    public:
        using SourceFactory = std::function<SplitSourcePtr<E>(const std::vector<E>&)>;

        VectorProducer(std::vector<E> elements, FeatureSet features, SourceFactory factory)
            : elements_(std::move(elements))
            , features_(features)
            , factory_(std::move(factory))
        {
            if (!factory_) {
                throw std::invalid_argument("VectorProducer: source factory is empty");
            }
        }

        [[nodiscard]] SplitSourcePtr<E> source() const override { return factory_(elements_); }

        [[nodiscard]] std::vector<E> orderedElements() const override { return elements_; }

        [[nodiscard]] std::size_t size() const override { return elements_.size(); }

        [[nodiscard]] FeatureSet features() const override { return features_; }

        /// @brief Mutable contents; sources bound afterwards see the change
        std::vector<E>& elements() noexcept { return elements_; }

    private:
        std::vector<E> elements_;
        FeatureSet features_;
        SourceFactory factory_;
    };

} // namespace splitkit
