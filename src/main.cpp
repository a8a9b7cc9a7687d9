#include "bubble/cli_options.hpp"
#include "bubble/diagnostics.hpp"
#include "bubble/event_generator.hpp"
#include "bubble/random_source.hpp"

#include <iostream>
#include <string>

namespace {

const char* ScenarioDescription(bubble::Scenario scenario) {
    switch (scenario) {
        case bubble::Scenario::ProtonProton:
            return "Proton-proton collision. Beam proton strikes a target at the chamber center.";
        case bubble::Scenario::NeutronDecay:
            return "Neutron beta decay. n -> p + e- + anti-nu_e.";
        case bubble::Scenario::MuonDecay:
            return "Muon decay. mu -> e + two neutrinos.";
        case bubble::Scenario::PionDecay:
            return "Pion decay. Charged pions chain through a muon; neutral pions give gamma + e+ e-.";
        case bubble::Scenario::PhotonPairProduction:
            return "Photon pair production. gamma -> e+ e-.";
    }
    return "Unknown";
}

}  // namespace

int main(int argc, char** argv) {
    bubble::CliOptions options;
    std::string error;
    if (!bubble::ParseCliArgs(argc, argv, &options, &error)) {
        if (options.helpRequested) {
            bubble::PrintUsage(std::cout, argv[0]);
            return 0;
        }
        std::cerr << error << "\n";
        bubble::PrintUsage(std::cerr, argv[0]);
        return 1;
    }

    const bubble::GeneratorConfig& config = options.config;
    bubble::MersenneRandomSource rng(config.seed);

    std::cout << "--- BUBBLE CHAMBER EVENT GENERATOR ---\n";
    std::cout << "SCENARIO: " << ScenarioDescription(config.scenario) << "\n";
    std::cout << "RUN MANIFEST | scenario=" << bubble::ScenarioName(config.scenario) << " seed=" << rng.ActiveSeed()
              << " events=" << options.eventCount;
    if (config.pionCharge.has_value()) {
        std::cout << " pion_charge=" << *config.pionCharge;
    }
    std::cout << "\n";
    std::cout << "------------------------------------------------------------\n";

    for (int i = 1; i <= options.eventCount; ++i) {
        const bubble::Event event = bubble::GenerateEvent(config, rng);
        bubble::PrintEventSummary(std::cout, i, bubble::SnapshotEvent(event, rng.ActiveSeed()));
    }

    std::cout << "------------------------------------------------------------\n";
    std::cout << "Generation Complete.\n";
    return 0;
}
