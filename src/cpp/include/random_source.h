#pragma once

#include <cstdint>
#include <random>
#include <string>

/// Source of the two draws a path consumes each year.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Draw from N(mean, stddev). stddev may be zero.
    virtual double normal(double mean, double stddev) = 0;

    /// Draw uniformly from [0, 1).
    virtual double uniform() = 0;
};

/// std::mt19937 backed source.
class MersenneSource : public RandomSource {
public:
    /// Seeded from std::random_device.
    MersenneSource();
    explicit MersenneSource(std::uint32_t seed);

    void reseed(std::uint32_t seed);

    /// Reseed onto a sub-stream keyed by (seed, key).
    void reseed(std::uint32_t seed, const std::string& key);

    double normal(double mean, double stddev) override;
    double uniform() override;

private:
    std::mt19937 rng_;
    std::normal_distribution<double> standard_normal_{0.0, 1.0};
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

/// A seed drawn from std::random_device.
std::uint32_t entropy_seed();
