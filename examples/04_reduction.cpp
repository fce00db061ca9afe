/*
================================================================================
EXAMPLE 04: REDUCTION - Checking that a Reduction Survives Splitting
================================================================================
DIFFICULTY: Beginner

DESCRIPTION
-----------
Two ways of computing the mean of a series of measurements are run through
ReductionTester. The first accumulates (sum, count) pairs and divides at the
end: its combiner is associative and every merge scheme agrees. The second
averages running means directly, which depends on how the input was cut: the
sequential and left folds give 6, the right fold gives 4.25, and none gives 5.

SPLITKIT FEATURES DEMONSTRATED
------------------------------
- Reducer<T, A, R>                 supplier / accumulator / combiner / finisher
- ReductionTester::expectReduces() One check per input vector
- Custom equivalence               Tolerance for floating-point results
- MergeScheme                      Sequential, left and right folds

================================================================================
*/

#include <cmath>
#include <iostream>
#include <utility>
#include <vector>
#include <splitkit/splitkit.h>

using namespace splitkit;

namespace {

    using SumCount = std::pair<double, long>;

    bool withinTolerance(const double& a, const double& b) { return std::abs(a - b) < 1e-9; }

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 04: Reduction\n";
    std::cout << "================================================================\n\n";

    try {
        const std::vector<double> readings{ 2.0, 4.0, 9.0 };
        const double mean = 5.0;

        // ====================================================================
        // (SUM, COUNT) THEN DIVIDE
        // ====================================================================
        Reducer<double, SumCount, double> byParts{
            [] { return SumCount{ 0.0, 0 }; },
            [](SumCount& acc, const double& x) { acc.first += x; ++acc.second; },
            [](SumCount a, SumCount b) { return SumCount{ a.first + b.first, a.second + b.second }; },
            [](SumCount a) { return a.second == 0 ? 0.0 : a.first / static_cast<double>(a.second); },
            false
        };

        auto good = ReductionTester<double, SumCount, double>(byParts, withinTolerance)
            .expectReduces(mean, readings)
            .expectReduces(0.0, {})
            .report();

        std::cout << "SUM AND COUNT\n";
        std::cout << "-------------\n";
        std::cout << good << "\n\n";

        // ====================================================================
        // MEAN OF MEANS
        // ====================================================================
        Reducer<double, double, double> meanOfMeans{
            [] { return 0.0; },
            [](double& acc, const double& x) { acc = acc == 0.0 ? x : (acc + x) / 2.0; },
            [](double a, double b) { return a == 0.0 ? b : b == 0.0 ? a : (a + b) / 2.0; },
            [](double a) { return a; },
            true
        };

        auto bad = ReductionTester<double, double, double>(meanOfMeans, withinTolerance)
            .expectReduces(mean, readings)
            .report();

        std::cout << "MEAN OF MEANS\n";
        std::cout << "-------------\n";
        std::cout << bad << "\n";

        good.throwIfFailed();

    } catch (ConformanceError& e) {
        std::cerr << "Reduction failure:\n" << e.what() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
