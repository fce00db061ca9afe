#pragma once
/*
===============================================================================
SPLITKIT — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for splitkit: a splittable traversal protocol and the
conformance harness that validates its implementations.

WHAT'S INCLUDED
---------------
• enum_utils.h          — COUNT-sentinel enums, EnumTable dispatch
• characteristics.h     — Characteristic / Characteristics flag set
• split_source.h        — SplitSource<E> protocol
• singleton_source.h    — SingletonSource<E>, singleton()
• indexed_source.h      — IndexedSource<E>, indexed(), viewOf()
• decomposition.h       — Strategy, decompose(), collect(), splitTree()
• collection_features.h — FeatureSet, SourceProducer<E>, VectorProducer<E>
• config.h              — HarnessOptions, SPLITKIT_DEBUG
• report.h              — ConformanceReport, Violation, describe()
• conformance.h         — CheckRegistry<E>, ConformanceHarness<E>
• reduction.h           — Reducer, ReductionTester, MergeScheme

QUICK START
-----------
    #include <splitkit/splitkit.h>

    int main() {
        using namespace splitkit;

        // Squares of 0..4, split down to single elements
        auto squares = indexed<int>(5,
            [](std::size_t i) { return static_cast<int>(i * i); },
            Characteristic::Ordered);
        for (int v : collect(Strategy::MaximumSplit, *squares)) {
            std::cout << v << " ";          // 0 1 4 9 16
        }

        // Validate a producer against every strategy
        VectorProducer<int> producer({ 1, 2, 3 }, { CollectionFeature::SupportsAdd },
            [](const std::vector<int>& v) { return viewOf(v); });
        std::cout << checkConformance(producer) << "\n";
        return 0;
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) with <format>
• Catch2 v3 for the test suite only

NAMESPACE
---------
Everything lives in `splitkit::`. Implementation details are in
`splitkit::detail::` and the standard checks in `splitkit::checks::`.

CONFIGURATION
-------------
• SPLITKIT_DEBUG or _DEBUG: harness logs passes and skips by default
• Otherwise only failures are logged, and only when a log sink is set

===============================================================================
*/

// Leaves first
#include "enum_utils.h"
#include "characteristics.h"

// Protocol and the two built-in sources
#include "split_source.h"
#include "singleton_source.h"
#include "indexed_source.h"

// Consumers
#include "decomposition.h"

// Harness
#include "collection_features.h"
#include "config.h"
#include "report.h"
#include "conformance.h"
#include "reduction.h"
