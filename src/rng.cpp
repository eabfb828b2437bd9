#include "rng.hpp"
#include "errors.hpp"
#include <string>

namespace reisim {

Rng::Rng(uint64_t seed) : seed_(seed), engine_(seed) {}

double Rng::uniform01() {
    // 53 random mantissa bits scaled by 2^-53
    return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
}

double Rng::uniform_open_low() {
    return 1.0 - uniform01();
}

uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

uint64_t derive_seed(uint64_t run_seed, uint64_t trial_index) {
    return splitmix64(run_seed ^ splitmix64(trial_index));
}

uint64_t entropy_seed() {
    try {
        std::random_device rd;
        uint64_t high = static_cast<uint64_t>(rd());
        uint64_t low = static_cast<uint64_t>(rd());
        return (high << 32) ^ low;
    } catch (const std::exception& e) {
        throw RngInitError(std::string("Failed to initialize entropy source: ") + e.what());
    }
}

} // namespace reisim
