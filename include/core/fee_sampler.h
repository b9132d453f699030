#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace spendguard {
namespace core {

struct FeeRange {
    uint64_t min = 0;
    uint64_t max = 0;

    bool valid() const { return min <= max; }
    std::string toString() const;

    // base +/- change, with the lower bound clamped at zero.
    static FeeRange fromCommission(uint64_t base, uint64_t change);
};

// Draws fees uniformly from a closed range. One instance per worker; not
// meant to be shared between threads.
class FeeSampler {
public:
    FeeSampler(const FeeRange& range, uint64_t seed);
    explicit FeeSampler(const FeeRange& range);

    uint64_t sample();

    const FeeRange& range() const { return range_; }
    uint64_t samplesDrawn() const { return drawn_; }

private:
    FeeRange range_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<uint64_t> dist_;
    uint64_t drawn_ = 0;
};

}
}
