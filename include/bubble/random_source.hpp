#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace bubble {

class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    // Uniform draw in [min, max).
    virtual double Uniform(double min, double max) = 0;
    // Uniform index in [0, count); count must be positive.
    virtual std::size_t UniformIndex(std::size_t count) = 0;

    bool Chance(double probability) { return Uniform(0.0, 1.0) < probability; }
};

class MersenneRandomSource final : public IRandomSource {
public:
    explicit MersenneRandomSource(std::optional<uint32_t> seed = std::nullopt);

    double Uniform(double min, double max) override;
    std::size_t UniformIndex(std::size_t count) override;

    uint64_t ActiveSeed() const { return activeSeed_; }

private:
    std::mt19937 rng_;
    uint64_t activeSeed_ = 0;
};

}  // namespace bubble
