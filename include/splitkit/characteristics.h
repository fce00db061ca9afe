#pragma once
/*
===============================================================================
CHARACTERISTICS — Producer-declared guarantees of a split source
===============================================================================

OVERVIEW
--------
A split source declares a fixed set of boolean traits describing its
remaining elements. Consumers (schedulers, the conformance harness) rely on
these declarations without re-verifying them, so a wrong declaration is a
silent correctness bug rather than a crash.

KEY COMPONENTS
--------------
• splitkit::Characteristic  — Sequential enum, one enumerator per trait
• splitkit::Characteristics — Value-type flag set (bit pattern over the enum)
• characteristicName()      — Upper-case trait name ("SUBSIZED")
• operator<<                — Renders a set as {ORDERED|SIZED}

SEMANTICS
---------
• Ordered     — elements have a defined encounter order
• Sorted      — encounter order follows comparator() (or natural order)
• Sized       — estimateSize() is exact
• Subsized    — every split-off part is Sized as well
• Distinct    — no two elements compare equal
• NonNull     — no element is null
• Immutable   — the backing storage cannot change during traversal
• Concurrent  — the backing storage may change safely during traversal

Flags are independent. Subsized implies Sized only as a producer obligation;
this type never adds implied flags on its own.

THREAD SAFETY
-------------
• Plain value type; all operations are const or act on a local copy

===============================================================================
*/

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include "enum_utils.h"

namespace splitkit {

    SPLITKIT_DECLARE_ENUM_WITH_COUNT(Characteristic,
        Ordered, Sorted, Sized, Subsized, Distinct, NonNull, Immutable, Concurrent);

    /// @brief Upper-case name of a characteristic, "UNKNOWN" for COUNT
    constexpr std::string_view characteristicName(Characteristic c) noexcept {
        constexpr EnumTable<Characteristic, std::string_view> names{{
            "ORDERED", "SORTED", "SIZED", "SUBSIZED",
            "DISTINCT", "NONNULL", "IMMUTABLE", "CONCURRENT"
        }};
        return is_valid_enum_value(c) ? names[c] : std::string_view{ "UNKNOWN" };
    }

    // ============================================================================
    // CHARACTERISTICS SET
    // ============================================================================
    /**
     * @class Characteristics
     * @brief Immutable-by-convention set of Characteristic flags
     *
     * @details One bit per enumerator, bit position = enum_index(c). The empty
     *          set is the default. Combining uses value semantics: every
     *          operator returns a new set.
     *
     * @example
     *   using enum splitkit::Characteristic;
     *   Characteristics c{ Ordered, Sized };
     *   c = c | Subsized;
     *   c.contains(Sized);        // true
     *   c.contains(Sorted);       // false
     */
    class Characteristics {
    public:
        using bits_type = std::uint32_t;

        constexpr Characteristics() noexcept = default;

        constexpr Characteristics(Characteristic c) noexcept
            : bits_(bitOf(c))
        {
        }

        constexpr Characteristics(std::initializer_list<Characteristic> flags) noexcept {
            for (Characteristic c : flags) {
                bits_ |= bitOf(c);
            }
        }

        /// @brief Rebuild a set from a raw bit pattern; unknown bits are dropped
        static constexpr Characteristics fromBits(bits_type bits) noexcept {
            Characteristics out;
            out.bits_ = bits & allBits();
            return out;
        }

        [[nodiscard]] constexpr bits_type bits() const noexcept { return bits_; }

        [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

        [[nodiscard]] constexpr bool contains(Characteristic c) const noexcept {
            return (bits_ & bitOf(c)) != 0;
        }

        /// @brief True if every flag of `other` is also in this set
        [[nodiscard]] constexpr bool containsAll(Characteristics other) const noexcept {
            return (bits_ & other.bits_) == other.bits_;
        }

        /// @brief Number of flags present
        [[nodiscard]] constexpr std::size_t count() const noexcept {
            std::size_t n = 0;
            for (bits_type b = bits_; b != 0; b &= b - 1) {
                ++n;
            }
            return n;
        }

        friend constexpr Characteristics operator|(Characteristics a, Characteristics b) noexcept {
            return fromBits(a.bits_ | b.bits_);
        }

        friend constexpr Characteristics operator&(Characteristics a, Characteristics b) noexcept {
            return fromBits(a.bits_ & b.bits_);
        }

        /// Removal: flags of `a` that are not in `b`
        friend constexpr Characteristics operator-(Characteristics a, Characteristics b) noexcept {
            return fromBits(a.bits_ & ~b.bits_);
        }

        friend constexpr bool operator==(Characteristics a, Characteristics b) noexcept = default;

        /// @brief Render as {FLAG|FLAG}, {} when empty
        [[nodiscard]] std::string toString() const {
            std::ostringstream os;
            os << *this;
            return os.str();
        }

        friend std::ostream& operator<<(std::ostream& os, Characteristics c) {
            os << '{';
            bool first = true;
            for (Characteristic flag : enum_values<Characteristic>()) {
                if (!c.contains(flag)) continue;
                if (!first) os << '|';
                os << characteristicName(flag);
                first = false;
            }
            return os << '}';
        }

    private:
        bits_type bits_ = 0;

        static constexpr bits_type bitOf(Characteristic c) noexcept {
            return is_valid_enum_value(c) ? (bits_type{ 1 } << enum_index(c)) : 0;
        }

        static constexpr bits_type allBits() noexcept {
            return (bits_type{ 1 } << Characteristic_COUNT) - 1;
        }
    };

    inline constexpr Characteristics operator|(Characteristic a, Characteristic b) noexcept {
        return Characteristics(a) | Characteristics(b);
    }

    inline std::ostream& operator<<(std::ostream& os, Characteristic c) {
        return os << characteristicName(c);
    }

} // namespace splitkit
