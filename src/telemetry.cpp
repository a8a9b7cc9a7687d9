#include "bubble/diagnostics.hpp"

#include <iomanip>
#include <ostream>

namespace bubble {

void PrintEventSummary(std::ostream& out, int eventIndex, const EventSnapshot& snapshot) {
    out << "[Event " << std::setw(4) << eventIndex << " | Seed " << snapshot.seed << "] "
        << "Scenario: " << std::left << std::setw(22) << ScenarioName(snapshot.scenario) << std::right << " | "
        << "Tracks: " << std::setw(2) << snapshot.topLevelTracks
        << " charged: " << std::setw(2) << snapshot.chargedTracks << " | "
        << "N: " << std::setw(2) << snapshot.identifiable
        << " neutrinos: " << snapshot.neutrinos << " | "
        << "vertices: " << snapshot.vertexCount
        << std::scientific << std::setprecision(3)
        << " | max_residual: " << snapshot.maxVertexResidual
        << " max_decay_offset: " << snapshot.maxDecayPointOffset << '\n'
        << std::defaultfloat;
}

}  // namespace bubble
