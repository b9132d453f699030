#include "core/fee_sampler.h"
#include <stdexcept>

namespace spendguard {
namespace core {

std::string FeeRange::toString() const {
    return "[" + std::to_string(min) + ", " + std::to_string(max) + "]";
}

FeeRange FeeRange::fromCommission(uint64_t base, uint64_t change) {
    FeeRange r;
    r.min = base > change ? base - change : 0;
    r.max = base + change;
    return r;
}

static FeeRange checkedRange(const FeeRange& range) {
    if (!range.valid()) {
        throw std::invalid_argument("fee range " + range.toString() + " has min > max");
    }
    return range;
}

FeeSampler::FeeSampler(const FeeRange& range, uint64_t seed)
    : range_(checkedRange(range)), rng_(seed), dist_(range_.min, range_.max) {}

FeeSampler::FeeSampler(const FeeRange& range)
    : FeeSampler(range, std::random_device{}()) {}

uint64_t FeeSampler::sample() {
    drawn_++;
    if (range_.min == range_.max) return range_.min;
    return dist_(rng_);
}

}
}
