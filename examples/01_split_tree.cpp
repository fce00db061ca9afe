/*
================================================================================
EXAMPLE 01: SPLIT TREE - Decomposing an Index Range
================================================================================
DIFFICULTY: Beginner

DESCRIPTION
-----------
Squares of 0..n-1 are exposed through an IndexedSource. The same source shape
is drained with each of the three strategies, which must agree, and then split
to exhaustion to show the balanced tree that midpoint splitting builds.

WHAT TO LOOK FOR
----------------
- Every strategy prints the same sequence
- The first split of [0,5) hands out {0, 1} and keeps {4, 9, 16}
- Split depth never exceeds ceil(log2(n))

SPLITKIT FEATURES DEMONSTRATED
------------------------------
- indexed<E>(n, fn, characteristics)   Source over an index function
- collect(strategy, source)            Drain into a vector
- trySplit() / estimateSize()          Manual splitting
- splitTree(source)                    Tree shape statistics
- singleton(value)                     One-element source

================================================================================
*/

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <splitkit/splitkit.h>

using namespace splitkit;

namespace {

    SplitSourcePtr<long> squares(std::size_t n) {
        return indexed<long>(n,
            [](std::size_t i) { return static_cast<long>(i * i); },
            Characteristic::Ordered | Characteristic::Immutable);
    }

    void print(const std::vector<long>& values) {
        std::cout << "{";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << values[i];
        }
        std::cout << "}";
    }

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Split Tree\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // STRATEGIES AGREE
        // ====================================================================
        std::cout << "STRATEGIES\n";
        std::cout << "----------\n";
        for (Strategy s : allStrategies()) {
            auto source = squares(5);
            std::cout << "  " << std::setw(14) << strategyName(s) << ": ";
            print(collect(s, *source));
            std::cout << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // ONE SPLIT BY HAND
        // ====================================================================
        std::cout << "MANUAL SPLIT\n";
        std::cout << "------------\n";
        auto source = squares(5);
        std::cout << "  characteristics: " << source->characteristics() << "\n";
        auto prefix = source->trySplit();
        std::cout << "  prefix    (" << prefix->estimateSize() << "): ";
        print(collect(Strategy::BulkDrain, *prefix));
        std::cout << "\n  remainder (" << source->estimateSize() << "): ";
        print(collect(Strategy::BulkDrain, *source));
        std::cout << "\n\n";

        // ====================================================================
        // TREE SHAPE
        // ====================================================================
        std::cout << "SPLIT TREE\n";
        std::cout << "----------\n";
        std::cout << std::setw(8) << "n" << std::setw(8) << "leaves"
                  << std::setw(8) << "splits" << std::setw(8) << "depth" << "\n";
        for (std::size_t n : { 1u, 2u, 5u, 16u, 17u, 1000u }) {
            auto s = squares(n);
            const SplitStats stats = splitTree(*s);
            std::cout << std::setw(8) << n << std::setw(8) << stats.leaves
                      << std::setw(8) << stats.splits << std::setw(8) << stats.maxDepth << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // SINGLETON
        // ====================================================================
        std::cout << "SINGLETON\n";
        std::cout << "---------\n";
        auto one = singleton(std::string("x"));
        std::cout << "  size before: " << one->estimateSize() << "\n";
        (void)one->tryAdvance([](const std::string& v) { std::cout << "  visited: " << v << "\n"; });
        std::cout << "  size after:  " << one->estimateSize() << "\n";
        std::cout << "  splits:      " << (one->trySplit() ? "yes" : "no") << "\n";

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
