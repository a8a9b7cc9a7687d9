#pragma once

#include <optional>

#include "bubble/config.hpp"
#include "bubble/event.hpp"
#include "bubble/random_source.hpp"

namespace bubble {

// Builds the complete event for config.scenario, background and numbering
// included. config.seed is not read here; callers seed rng with it.
Event GenerateEvent(const GeneratorConfig& config, IRandomSource& rng);

std::vector<Track> GenerateProtonProton(IRandomSource& rng);
std::vector<Track> GenerateNeutronDecay(IRandomSource& rng);
std::vector<Track> GenerateMuonDecay(IRandomSource& rng);
// pionCharge unset draws uniformly from {-1, +1, 0}.
std::vector<Track> GeneratePionDecay(IRandomSource& rng, std::optional<int> pionCharge = std::nullopt);
std::vector<Track> GeneratePhotonPairProduction(IRandomSource& rng);

ChamberBackground GenerateBackground(IRandomSource& rng);

}  // namespace bubble
