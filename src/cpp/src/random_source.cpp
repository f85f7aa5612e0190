#include "random_source.h"

#include <vector>

std::uint32_t entropy_seed() {
    std::random_device device;
    return device();
}

MersenneSource::MersenneSource() : rng_(entropy_seed()) {}

MersenneSource::MersenneSource(std::uint32_t seed) : rng_(seed) {}

void MersenneSource::reseed(std::uint32_t seed) {
    rng_.seed(seed);
    // normal_distribution caches the second value of each pair.
    standard_normal_.reset();
    unit_.reset();
}

void MersenneSource::reseed(std::uint32_t seed, const std::string& key) {
    std::vector<std::uint32_t> material;
    material.reserve(key.size() + 1);
    material.push_back(seed);
    for (unsigned char c : key) {
        material.push_back(c);
    }
    std::seed_seq seq(material.begin(), material.end());
    rng_.seed(seq);
    standard_normal_.reset();
    unit_.reset();
}

// Scale a standard normal so zero volatility still consumes one draw.
double MersenneSource::normal(double mean, double stddev) {
    return mean + stddev * standard_normal_(rng_);
}

double MersenneSource::uniform() {
    return unit_(rng_);
}
