#include "bubble/random_source.hpp"

namespace bubble {

MersenneRandomSource::MersenneRandomSource(std::optional<uint32_t> seed) {
    if (seed.has_value()) {
        activeSeed_ = seed.value();
    } else {
        activeSeed_ = static_cast<uint64_t>(std::random_device{}());
    }
    rng_.seed(static_cast<uint32_t>(activeSeed_));
}

double MersenneRandomSource::Uniform(double min, double max) {
    if (!(max > min)) {
        return min;
    }
    std::uniform_real_distribution<double> dist(min, max);
    return dist(rng_);
}

std::size_t MersenneRandomSource::UniformIndex(std::size_t count) {
    if (count <= 1) {
        return 0;
    }
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

}  // namespace bubble
