#ifndef REISIM_RNG_HPP
#define REISIM_RNG_HPP

#include <cstdint>
#include <random>

namespace reisim {

// Explicit random source handed to every sampling call.
// Wraps a 64-bit Mersenne Twister; uniform draws are built from the top 53 bits
// so a given seed yields the same doubles on every platform.
class Rng {
public:
    explicit Rng(uint64_t seed);

    // Uniform double in [0, 1)
    double uniform01();

    // Uniform double in (0, 1], safe as a log() argument
    double uniform_open_low();

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

// SplitMix64 finalizer
uint64_t splitmix64(uint64_t x);

// Seed for trial `trial_index` of a run seeded with `run_seed`.
// Sub-streams do not depend on execution order, so parallel and sequential
// runs draw identical values for each trial.
uint64_t derive_seed(uint64_t run_seed, uint64_t trial_index);

// Fresh run seed from std::random_device.
// Throws RngInitError if the entropy source is unavailable.
uint64_t entropy_seed();

} // namespace reisim

#endif // REISIM_RNG_HPP
