#include "core/fee_sampler.h"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <stdexcept>
#include <vector>

namespace spendguard {
namespace tests {

class FeeSamplerTests {
public:
    static void runAll() {
        testFixedFee();
        testBounds();
        testInvalidRange();
        testCommissionRange();
        testSeededSequence();
        std::cout << "All fee sampler tests passed!" << std::endl;
    }

    static void testFixedFee() {
        std::cout << "Testing fixed fee..." << std::endl;

        core::FeeSampler sampler(core::FeeRange{7, 7}, 42);
        for (int i = 0; i < 100; i++) {
            assert(sampler.sample() == 7);
        }
        assert(sampler.samplesDrawn() == 100);

        std::cout << "  Fixed fee: PASSED" << std::endl;
    }

    static void testBounds() {
        std::cout << "Testing sample bounds..." << std::endl;

        core::FeeSampler sampler(core::FeeRange{3, 9}, 1234);
        std::set<uint64_t> seen;
        for (int i = 0; i < 5000; i++) {
            uint64_t fee = sampler.sample();
            assert(fee >= 3 && fee <= 9);
            seen.insert(fee);
        }
        // Both ends of the closed range are reachable.
        assert(seen.count(3) == 1);
        assert(seen.count(9) == 1);
        assert(seen.size() == 7);

        std::cout << "  Sample bounds: PASSED" << std::endl;
    }

    static void testInvalidRange() {
        std::cout << "Testing invalid range..." << std::endl;

        core::FeeRange bad{10, 5};
        assert(!bad.valid());
        bool threw = false;
        try {
            core::FeeSampler sampler(bad, 1);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  Invalid range: PASSED" << std::endl;
    }

    static void testCommissionRange() {
        std::cout << "Testing commission range..." << std::endl;

        core::FeeRange r = core::FeeRange::fromCommission(10, 3);
        assert(r.min == 7);
        assert(r.max == 13);

        core::FeeRange clamped = core::FeeRange::fromCommission(2, 5);
        assert(clamped.min == 0);
        assert(clamped.max == 7);
        assert(clamped.valid());

        assert(core::FeeRange::fromCommission(4, 0).toString() == "[4, 4]");

        std::cout << "  Commission range: PASSED" << std::endl;
    }

    static void testSeededSequence() {
        std::cout << "Testing seeded sequence..." << std::endl;

        core::FeeSampler a(core::FeeRange{0, 1000000}, 99);
        core::FeeSampler b(core::FeeRange{0, 1000000}, 99);
        std::vector<uint64_t> first;
        std::vector<uint64_t> second;
        for (int i = 0; i < 32; i++) {
            first.push_back(a.sample());
            second.push_back(b.sample());
        }
        assert(first == second);

        core::FeeSampler c(core::FeeRange{0, 1000000}, 100);
        std::vector<uint64_t> third;
        for (int i = 0; i < 32; i++) third.push_back(c.sample());
        assert(first != third);

        std::cout << "  Seeded sequence: PASSED" << std::endl;
    }
};

}
}

int main() {
    spendguard::tests::FeeSamplerTests::runAll();
    return 0;
}
