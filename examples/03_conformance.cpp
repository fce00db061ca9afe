/*
================================================================================
EXAMPLE 03: CONFORMANCE - Validating a Hand-Written Split Source
================================================================================
DIFFICULTY: Intermediate

DESCRIPTION
-----------
A ring buffer of log lines exposes its contents through a custom SplitSource.
The conformance harness drains it with every strategy and cross-checks
elements, order, size and declared characteristics. A second version of the
same source has an off-by-one in trySplit() and declares IMMUTABLE over a
buffer that accepts appends; the report names both defects.

SPLITKIT FEATURES DEMONSTRATED
------------------------------
- SplitSource<E>                   Implementing the protocol
- SourceProducer<E>                Describing a collection to the harness
- ConformanceHarness<E>::run()     Running the standard checks
- HarnessOptions::withLog()        One log line per check outcome
- ConformanceReport                Violations, passes and skips

================================================================================
*/

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <splitkit/splitkit.h>

using namespace splitkit;

// ============================================================================
// RING BUFFER AND ITS SOURCE
// ============================================================================
class LineRing {
public:
    explicit LineRing(std::size_t capacity) : slots_(capacity) {}

    void append(std::string line) {
        slots_[(head_ + count_) % slots_.size()] = std::move(line);
        if (count_ < slots_.size()) ++count_;
        else head_ = (head_ + 1) % slots_.size();
    }

    std::size_t size() const { return count_; }
    const std::string& at(std::size_t i) const { return slots_[(head_ + i) % slots_.size()]; }

private:
    std::vector<std::string> slots_;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
};

class RingSource final : public SplitSource<std::string> {
public:
    RingSource(const LineRing& ring, std::size_t lo, std::size_t hi, bool buggy)
        : ring_(ring), lo_(lo), hi_(hi), buggy_(buggy) {}

    bool tryAdvance(const Visitor& visit) override {
        if (lo_ >= hi_) return false;
        const std::string& line = ring_.at(lo_++);
        visit(line);
        return true;
    }

    std::unique_ptr<SplitSource<std::string>> trySplit() override {
        const std::size_t mid = lo_ + (hi_ - lo_) / 2;
        if (lo_ >= mid) return nullptr;
        // The buggy version lets the prefix run one past the midpoint
        auto prefix = std::make_unique<RingSource>(ring_, lo_, buggy_ && mid < hi_ - 1 ? mid + 1 : mid, buggy_);
        lo_ = mid;
        return prefix;
    }

    size_type estimateSize() const override { return hi_ - lo_; }

    Characteristics characteristics() const noexcept override {
        Characteristics c{ Characteristic::Ordered, Characteristic::Sized,
                           Characteristic::Subsized, Characteristic::NonNull };
        return buggy_ ? c | Characteristic::Immutable : c;
    }

private:
    const LineRing& ring_;
    std::size_t lo_;
    std::size_t hi_;
    bool buggy_;
};

class RingProducer final : public SourceProducer<std::string> {
public:
    RingProducer(const LineRing& ring, bool buggy) : ring_(ring), buggy_(buggy) {}

    SplitSourcePtr<std::string> source() const override {
        return std::make_unique<RingSource>(ring_, 0, ring_.size(), buggy_);
    }

    std::vector<std::string> orderedElements() const override {
        std::vector<std::string> out;
        for (std::size_t i = 0; i < ring_.size(); ++i) out.push_back(ring_.at(i));
        return out;
    }

    FeatureSet features() const override { return { CollectionFeature::SupportsAdd }; }

private:
    const LineRing& ring_;
    bool buggy_;
};

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: Conformance\n";
    std::cout << "================================================================\n\n";

    try {
        LineRing ring(4);
        for (const char* line : { "boot", "mount /", "start sshd", "login root", "logout" }) {
            ring.append(line);
        }

        HarnessOptions opts;
        opts.withLog(std::cout, true).withMaxEchoedElements(8);
        ConformanceHarness<std::string> harness(opts);

        std::cout << "CORRECT SOURCE\n";
        std::cout << "--------------\n";
        auto good = harness.run(RingProducer(ring, false));
        std::cout << good << "\n\n";

        std::cout << "BUGGY SOURCE\n";
        std::cout << "------------\n";
        auto bad = harness.run(RingProducer(ring, true));
        std::cout << bad << "\n";

        good.throwIfFailed();
        if (bad.ok()) {
            std::cerr << "Error: defects in the buggy source went unnoticed\n";
            return 1;
        }

    } catch (ConformanceError& e) {
        std::cerr << "Conformance failure:\n" << e.what() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
