#include "mtrandom.h"

#include <limits>

namespace agerisk {

// -----------------------------------------------------------------------
// Mersenne Twister 19937 (32 bit) random bit generator

MTRandom32::MTRandom32(const unsigned int seed) { engine_.seed(seed); }

unsigned int MTRandom32::operator()() { return engine_(); }

double MTRandom32::next_double() noexcept {
    return std::generate_canonical<double, std::numeric_limits<double>::digits>(engine_);
}
} // namespace agerisk
