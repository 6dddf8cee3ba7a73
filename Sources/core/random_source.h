#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>

namespace figfuzz {

inline uint64_t splitmix64(uint64_t& state) {
    uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30u)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27u)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31u);
}

inline uint64_t time_based_seed() {
    return static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

// Every generator draws from an instance passed in by the caller. Two sources
// built from the same seed produce the same sequence.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed) : seed_(seed) {
        uint64_t state = seed;
        rng_.seed(splitmix64(state));
    }

    uint64_t seed() const {
        return seed_;
    }

    // Inclusive on both ends. Callers guarantee lo <= hi.
    int uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

    bool chance(double p) {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng_) < p;
    }

    template<typename Container>
    const typename Container::value_type& pick(const Container& items) {
        const int idx = uniform_int(0, static_cast<int>(items.size()) - 1);
        return items[static_cast<size_t>(idx)];
    }

    std::mt19937_64& engine() {
        return rng_;
    }

private:
    uint64_t seed_ = 0;
    std::mt19937_64 rng_;
};

} // namespace figfuzz
