/*
================================================================================
EXAMPLE 02: PARALLEL SUM - Handing Split Prefixes to Worker Threads
================================================================================
DIFFICULTY: Intermediate

DESCRIPTION
-----------
A large index range is split a fixed number of times; each prefix and the final
remainder go to their own std::thread, which drains its part with
forEachRemaining(). Partial sums are combined at the end and compared with the
closed-form total.

A split source is not thread-safe, but split-off parts are independent: once
trySplit() has returned, the prefix and the parent may be driven on different
threads.

SPLITKIT FEATURES DEMONSTRATED
------------------------------
- indexed<E>(n, fn, characteristics)   Source over an arithmetic sequence
- trySplit()                           Partitioning for parallel work
- forEachRemaining()                   Bulk drain per worker
- Reducer / reduceWith()               Combining partial results

================================================================================
*/

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>
#include <splitkit/splitkit.h>

using namespace splitkit;

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Parallel Sum\n";
    std::cout << "================================================================\n\n";

    try {
        const std::size_t n = 10'000'000;
        const unsigned workers = std::max(2u, std::thread::hardware_concurrency());

        auto root = indexed<std::uint64_t>(n,
            [](std::size_t i) { return static_cast<std::uint64_t>(i + 1); },
            Characteristic::Ordered | Characteristic::Immutable);

        // ====================================================================
        // PARTITION
        // ====================================================================
        // Split the largest part until there are enough of them
        std::vector<SplitSourcePtr<std::uint64_t>> parts;
        parts.push_back(std::move(root));
        while (parts.size() < workers) {
            std::size_t largest = 0;
            for (std::size_t i = 1; i < parts.size(); ++i) {
                if (parts[i]->estimateSize() > parts[largest]->estimateSize()) largest = i;
            }
            auto prefix = parts[largest]->trySplit();
            if (!prefix) break;
            parts.push_back(std::move(prefix));
        }

        std::cout << "PARTS\n";
        std::cout << "-----\n";
        for (std::size_t i = 0; i < parts.size(); ++i) {
            std::cout << "  part " << i << ": " << parts[i]->estimateSize() << " elements\n";
        }
        std::cout << "\n";

        // ====================================================================
        // DRAIN IN PARALLEL
        // ====================================================================
        std::vector<std::uint64_t> partial(parts.size(), 0);
        {
            std::vector<std::thread> threads;
            threads.reserve(parts.size());
            for (std::size_t i = 0; i < parts.size(); ++i) {
                threads.emplace_back([&parts, &partial, i] {
                    parts[i]->forEachRemaining([&](const std::uint64_t& v) { partial[i] += v; });
                });
            }
            for (auto& t : threads) t.join();
        }

        // ====================================================================
        // COMBINE
        // ====================================================================
        Reducer<std::uint64_t, std::uint64_t, std::uint64_t> sum{
            [] { return std::uint64_t{ 0 }; },
            [](std::uint64_t& acc, const std::uint64_t& v) { acc += v; },
            [](std::uint64_t a, std::uint64_t b) { return a + b; },
            [](std::uint64_t a) { return a; },
            true
        };
        const std::uint64_t total = reduceWith(MergeScheme::MergeRightAssociative, sum, partial);
        const std::uint64_t expected = static_cast<std::uint64_t>(n) * (n + 1) / 2;

        std::cout << "RESULT\n";
        std::cout << "------\n";
        std::cout << "  threads:  " << parts.size() << "\n";
        std::cout << "  total:    " << total << "\n";
        std::cout << "  expected: " << expected << "\n";
        std::cout << "  " << (total == expected ? "OK" : "MISMATCH") << "\n";

        if (total != expected) return 1;

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
