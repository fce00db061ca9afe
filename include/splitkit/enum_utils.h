#pragma once
/*
===============================================================================
ENUM UTILS — Closed enumerations and enum-indexed tables for splitkit
===============================================================================

OVERVIEW
--------
splitkit models every closed vocabulary (characteristics, decomposition
strategies, reduction merge schemes, collection features) as a sequential
enum class with a trailing COUNT sentinel. This header provides the macro
that declares such enums, plus the small set of helpers used to iterate
them and to dispatch through per-enumerator tables without virtual calls.

KEY COMPONENTS
--------------
• SPLITKIT_DECLARE_ENUM_WITH_COUNT: Declares enum class + <Name>_COUNT
• enum_size<Enum>: Compile-time enumerator count
• enum_index / enum_from_value: Conversions to and from table positions
• is_valid_enum_value: Bounds check (COUNT is not a valid value)
• enum_values<Enum>(): All enumerators in declaration order
• EnumTable<Enum, T>: Fixed-size array indexed by enumerator

USAGE EXAMPLES
--------------
    SPLITKIT_DECLARE_ENUM_WITH_COUNT(Operation, Add, Subtract);

    constexpr splitkit::EnumTable<Operation, int(*)(int, int)> handlers{{
        [](int a, int b) { return a + b; },
        [](int a, int b) { return a - b; },
    }};

    int r = handlers[Operation::Subtract](5, 3);   // 2

    for (Operation op : splitkit::enum_values<Operation>()) { ... }

DEPENDENCIES
------------
• <array>, <cstddef>, <format>, <stdexcept>

THREAD SAFETY
-------------
• Everything here is constexpr or operates on caller-owned values

EXCEPTION SAFETY
----------------
• No-throw, except EnumTable::at() which throws std::out_of_range

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>

/**
 * @macro SPLITKIT_DECLARE_ENUM_WITH_COUNT
 * @brief Declares a strongly-typed enum class with automatic COUNT sentinel
 *
 * @param Name The name of the enumeration type
 * @param ...  Comma-separated enumerator identifiers (at least one)
 *
 * @details
 * Expands to:
 * 1. `enum class Name { ..., COUNT };`
 * 2. `static constexpr std::size_t Name_COUNT` equal to the number of
 *    user enumerators
 *
 * Enumerators are sequential from 0, so each one is directly usable as a
 * table position (see EnumTable).
 *
 * @warning Do not define COUNT yourself; it is always appended.
 */
#define SPLITKIT_DECLARE_ENUM_WITH_COUNT(Name, ...)                       \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace splitkit {

    /**
     * @brief Compile-time enumerator count
     * @details Primary template relies on the COUNT sentinel. Specialize for
     *          enums declared without the macro.
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /// @brief Table position of an enumerator
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /// @brief True if `value` names a user enumerator (COUNT is rejected)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return enum_index(value) < enum_size_v<Enum>;
    }

    /// @brief Convert a trusted table position back to an enumerator
    /// @pre value < enum_size_v<Enum>
    template<typename Enum>
    constexpr Enum enum_from_value(std::size_t value) noexcept {
        return static_cast<Enum>(value);
    }

    /**
     * @brief All enumerators of `Enum` in declaration order
     *
     * @example
     *     for (auto s : enum_values<Strategy>()) run(s);
     */
    template<typename Enum>
    constexpr std::array<Enum, enum_size_v<Enum>> enum_values() noexcept {
        std::array<Enum, enum_size_v<Enum>> out{};
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i] = enum_from_value<Enum>(i);
        }
        return out;
    }

    // ============================================================================
    // ENUM-INDEXED TABLE
    // ============================================================================
    /**
     * @class EnumTable
     * @brief Fixed-size array with one slot per enumerator
     *
     * @details Aggregate over `std::array`, so it can be brace-initialized in
     *          declaration order and used in constant expressions. Indexing
     *          with an enumerator is unchecked; at() is checked.
     *
     * @example
     *     constexpr EnumTable<Strategy, const char*> names{{
     *         "bulkDrain", "stepAdvance", "maximumSplit"
     *     }};
     *     names[Strategy::StepAdvance];   // "stepAdvance"
     */
    template<typename Enum, typename T>
    struct EnumTable {
        std::array<T, enum_size_v<Enum>> slots;

        constexpr const T& operator[](Enum key) const noexcept {
            return slots[enum_index(key)];
        }

        constexpr T& operator[](Enum key) noexcept {
            return slots[enum_index(key)];
        }

        /// @throws std::out_of_range if key is COUNT or outside the enum
        const T& at(Enum key) const {
            if (!is_valid_enum_value(key)) {
                throw std::out_of_range(
                    std::format("EnumTable::at: enumerator {} outside [0, {})",
                        enum_index(key), enum_size_v<Enum>));
            }
            return slots[enum_index(key)];
        }

        static constexpr std::size_t size() noexcept { return enum_size_v<Enum>; }

        constexpr auto begin() const noexcept { return slots.begin(); }
        constexpr auto end() const noexcept { return slots.end(); }
    };

} // namespace splitkit
