#pragma once
/*
===============================================================================
REPORT — Check outcomes collected by the conformance and reduction testers
===============================================================================

OVERVIEW
--------
Protocol violations (overlapping splits, re-emitted elements, wrong sizes,
false characteristic declarations) are never thrown by sources. They are
found by the testers and recorded here, one Violation per failing
(check, strategy) pair, so a failure names the decomposition path that
diverged and shows expected vs actual data.

KEY COMPONENTS
--------------
• Violation          — check name, strategy name ("-" if none), message
• ConformanceReport  — passes, skips and violations of one run
• ConformanceError   — std::runtime_error thrown by throwIfFailed()
• describe()         — element / sequence rendering used in messages

RENDERING
---------
Elements print via operator<< when they are streamable, strings are quoted,
empty std::optional and null pointers print as `null`, anything else prints
as `<?>`. Sequences print as [a, b, c] and are cut after a configurable
number of elements with `, ...`.

===============================================================================
*/

#include <concepts>
#include <cstddef>
#include <format>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace splitkit {

    namespace detail {

        template<typename T>
        concept Streamable = requires(std::ostream & os, const T & value) {
            { os << value } -> std::same_as<std::ostream&>;
        };

        template<typename T>
        struct is_optional : std::false_type {};

        template<typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template<typename T>
        void describeInto(std::ostream& os, const T& value) {
            if constexpr (is_optional<T>::value) {
                if (!value) os << "null";
                else describeInto(os, *value);
            }
            else if constexpr (std::is_pointer_v<T>) {
                if (value == nullptr) os << "null";
                else if constexpr (Streamable<T>) os << value;
                else os << "<?>";
            }
            else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
                os << '"' << std::string_view(value) << '"';
            }
            else if constexpr (Streamable<T>) {
                os << value;
            }
            else {
                os << "<?>";
            }
        }

    } // namespace detail

    /// @brief Human-readable rendering of one element
    template<typename T>
    std::string describe(const T& value) {
        std::ostringstream os;
        detail::describeInto(os, value);
        return os.str();
    }

    /// @brief Render a sequence as [a, b, c], cut after `limit` elements
    template<typename T>
    std::string describe(const std::vector<T>& values, std::size_t limit) {
        std::ostringstream os;
        os << '[';
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i == limit) {
                os << ", ...";
                break;
            }
            if (i > 0) os << ", ";
            detail::describeInto(os, values[i]);
        }
        os << ']';
        return os.str();
    }

    // ============================================================================
    // VIOLATIONS AND REPORT
    // ============================================================================

    struct Violation {
        std::string check;
        std::string strategy;   ///< "-" when the check is not per-strategy
        std::string message;

        friend std::ostream& operator<<(std::ostream& os, const Violation& v) {
            return os << std::format("{} [{}]: {}", v.check, v.strategy, v.message);
        }
    };

    class ConformanceError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class ConformanceReport
     * @brief Outcome of one harness or reduction-tester run
     *
     * @details A check is listed under passed() only if it ran and produced
     *          no violation. skipped() lists checks whose feature/size gate
     *          or whose source characteristics made them inapplicable, with
     *          the reason.
     */
    class ConformanceReport {
    public:
        void addPass(std::string check) { passed_.push_back(std::move(check)); }

        void addSkip(std::string check, std::string reason) {
            skipped_.emplace_back(std::move(check), std::move(reason));
        }

        void addViolation(Violation v) { violations_.push_back(std::move(v)); }

        /// @brief Append another report's entries to this one
        void merge(const ConformanceReport& other) {
            passed_.insert(passed_.end(), other.passed_.begin(), other.passed_.end());
            skipped_.insert(skipped_.end(), other.skipped_.begin(), other.skipped_.end());
            violations_.insert(violations_.end(), other.violations_.begin(), other.violations_.end());
        }

        [[nodiscard]] bool ok() const noexcept { return violations_.empty(); }

        [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return violations_; }
        [[nodiscard]] const std::vector<std::string>& passed() const noexcept { return passed_; }
        [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& skipped() const noexcept {
            return skipped_;
        }

        /// @brief True if at least one violation was recorded for `check`
        [[nodiscard]] bool failed(std::string_view check) const {
            for (const auto& v : violations_) {
                if (v.check == check) return true;
            }
            return false;
        }

        /// @brief True if `check` ran cleanly
        [[nodiscard]] bool hasPassed(std::string_view check) const {
            for (const auto& p : passed_) {
                if (p == check) return true;
            }
            return false;
        }

        /// @brief True if `check` was not applicable
        [[nodiscard]] bool wasSkipped(std::string_view check) const {
            for (const auto& [name, reason] : skipped_) {
                if (name == check) return true;
            }
            return false;
        }

        /// @brief One-line totals followed by one line per violation
        [[nodiscard]] std::string summary() const {
            std::string out = std::format("{} passed, {} skipped, {} violation(s)",
                passed_.size(), skipped_.size(), violations_.size());
            for (const auto& v : violations_) {
                out += std::format("\n  {} [{}]: {}", v.check, v.strategy, v.message);
            }
            return out;
        }

        /// @throws ConformanceError carrying summary() if any violation exists
        void throwIfFailed() const {
            if (!ok()) {
                throw ConformanceError(summary());
            }
        }

        friend std::ostream& operator<<(std::ostream& os, const ConformanceReport& r) {
            return os << r.summary();
        }

    private:
        std::vector<std::string> passed_;
        std::vector<std::pair<std::string, std::string>> skipped_;
        std::vector<Violation> violations_;
    };

} // namespace splitkit
