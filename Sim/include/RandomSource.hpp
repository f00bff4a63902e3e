#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include <stdexcept>

// Seeded random source owned by one simulation run.
// CloudCoverage, Load and Inverter draw from the same instance, so the
// order in which the engine calls them fixes the whole sequence.
class RandomSource {
public:
    explicit RandomSource(std::uint64_t seed) : seed_(seed), gen_(seed) {}

    std::uint64_t seed() const { return seed_; }

    // [0,1)
    double uniform01() {
        std::uniform_real_distribution<double> d(0.0, 1.0);
        return d(gen_);
    }

    // [lo, hi)
    double uniform(double lo, double hi) {
        return lo + (hi - lo) * uniform01();
    }

    // Inclusive range [lo, hi].
    int uniformInt(int lo, int hi) {
        std::uniform_int_distribution<int> d(lo, hi);
        return d(gen_);
    }

    // True with probability p.
    bool chance(double p) {
        return uniform01() < p;
    }

    // Index drawn with probability proportional to weights[i].
    std::size_t weightedIndex(const std::vector<double>& weights) {
        double total = 0.0;
        for (double w : weights) total += w;
        if (weights.empty() || total <= 0.0) {
            throw std::invalid_argument("RandomSource: weights must have a positive sum");
        }

        const double r = uniform01() * total;
        double acc = 0.0;
        for (std::size_t i = 0; i < weights.size(); ++i) {
            acc += weights[i];
            if (r < acc) return i;
        }
        return weights.size() - 1;
    }

private:
    std::uint64_t   seed_;
    std::mt19937_64 gen_;
};
