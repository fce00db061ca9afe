#pragma once
/*
===============================================================================
CONFIG — Build switches and harness options
===============================================================================

OVERVIEW
--------
Two layers, as elsewhere in splitkit:

• Build-time: SPLITKIT_DEBUG (or _DEBUG) turns on verbose harness logging by
  default. Not runtime configurable; see kVerboseDefault.
• Runtime: HarnessOptions, passed to the conformance harness and the
  reduction tester. Plain struct with fluent setters.

LOGGING
-------
There is no logging library. The harness writes one line per check outcome
to HarnessOptions::log when it is set, and stays silent when it is null:

    [splitkit] check=elements strategy=maximumSplit result=FAIL ...

Release builds log failures only; debug builds (or logPasses = true) also
log passes and skipped checks.

USAGE
-----
    splitkit::HarnessOptions opts;
    opts.withLog(std::cerr)
        .withStrategies({ splitkit::Strategy::MaximumSplit })
        .withFailFast(true);

===============================================================================
*/

#include <cstddef>
#include <format>
#include <initializer_list>
#include <ostream>
#include <string_view>
#include <vector>

#include "decomposition.h"

#if defined(SPLITKIT_DEBUG) || defined(_DEBUG)
#define SPLITKIT_VERBOSE_DEFAULT true
#else
#define SPLITKIT_VERBOSE_DEFAULT false
#endif

namespace splitkit {

    /// @brief Default for HarnessOptions::logPasses (true in debug builds)
    inline constexpr bool kVerboseDefault = SPLITKIT_VERBOSE_DEFAULT;

    inline std::vector<Strategy> defaultStrategies() {
        constexpr auto all = allStrategies();
        return std::vector<Strategy>(all.begin(), all.end());
    }

    struct HarnessOptions {
        /// Strategies each multi-strategy check runs, in this order
        std::vector<Strategy> strategies = defaultStrategies();

        /// Stop running checks after the first violation
        bool failFast = false;

        /// Elements echoed per sequence in violation messages
        std::size_t maxEchoedElements = 32;

        /// Log sink; nullptr disables logging
        std::ostream* log = nullptr;

        /// Also log passing and skipped checks
        bool logPasses = kVerboseDefault;

        HarnessOptions& withStrategies(std::initializer_list<Strategy> s) {
            strategies.assign(s.begin(), s.end());
            return *this;
        }

        HarnessOptions& withFailFast(bool on = true) {
            failFast = on;
            return *this;
        }

        HarnessOptions& withMaxEchoedElements(std::size_t n) {
            maxEchoedElements = n;
            return *this;
        }

        HarnessOptions& withLog(std::ostream& os, bool passesToo = kVerboseDefault) {
            log = &os;
            logPasses = passesToo;
            return *this;
        }
    };

    namespace detail {

        inline void logOutcome(const HarnessOptions& opts, std::string_view check,
            std::string_view strategy, std::string_view result, std::string_view message = {}) {
            if (opts.log == nullptr) return;
            if (result != "FAIL" && !opts.logPasses) return;
            *opts.log << std::format("[splitkit] check={} strategy={} result={}",
                check, strategy.empty() ? std::string_view{ "-" } : strategy, result);
            if (!message.empty()) {
                *opts.log << ' ' << message;
            }
            *opts.log << '\n';
        }

    } // namespace detail

} // namespace splitkit
