#include <array>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace {

std::string RunCommandCapture(const std::string& command) {
    std::array<char, 256> buffer{};
    std::string output;

    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        throw std::runtime_error("popen failed");
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }

    const int rc = pclose(pipe);
    if (rc != 0) {
        std::ostringstream oss;
        oss << "command failed with rc=" << rc << ": " << command << "\n" << output;
        throw std::runtime_error(oss.str());
    }

    return output;
}

std::size_t CountOccurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

std::vector<std::string> EventLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream input(output);
    std::string line;
    while (std::getline(input, line)) {
        if (line.rfind("[Event", 0) == 0) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string Command(const std::string& args) {
    return std::string("\"") + BUBBLE_CHAMBER_PATH + "\" " + args;
}

}  // namespace

TEST(IntegrationTest, NeutronRunPrintsManifestAndEventSummaries) {
    const std::string output = RunCommandCapture(Command("--scenario neutron --seed 7 --events 3"));

    EXPECT_NE(output.find("--- BUBBLE CHAMBER EVENT GENERATOR ---"), std::string::npos);
    EXPECT_NE(output.find("RUN MANIFEST | scenario=NEUTRON_DECAY seed=7 events=3"), std::string::npos);
    EXPECT_NE(output.find("Generation Complete."), std::string::npos);

    const std::vector<std::string> lines = EventLines(output);
    ASSERT_EQ(lines.size(), 3U);
    for (const std::string& line : lines) {
        EXPECT_NE(line.find("Seed 7]"), std::string::npos) << line;
        EXPECT_NE(line.find("Tracks:  3 charged:  2"), std::string::npos) << line;
        EXPECT_NE(line.find("N:  3 neutrinos: 1"), std::string::npos) << line;
        EXPECT_NE(line.find("max_residual:"), std::string::npos) << line;
    }
}

TEST(IntegrationTest, SeededRunsAreReproducible) {
    const std::string command = Command("--scenario pp --seed 1234 --events 4");
    const std::string first = RunCommandCapture(command);
    const std::string second = RunCommandCapture(command);
    EXPECT_EQ(first, second);
    EXPECT_EQ(CountOccurrences(first, "[Event"), 4U);
    EXPECT_EQ(CountOccurrences(first, "neutrinos: 6"), 4U);
}

TEST(IntegrationTest, PionChargeIsReportedInManifest) {
    const std::string output = RunCommandCapture(Command("--scenario pion --pion-charge 0 --seed 5 --events 2"));
    EXPECT_NE(output.find("pion_charge=0"), std::string::npos);
    EXPECT_EQ(CountOccurrences(output, "Tracks:  4 charged:  2"), 2U);
    EXPECT_EQ(CountOccurrences(output, "neutrinos: 0"), 2U);
}

TEST(IntegrationTest, HelpExitsCleanly) {
    const std::string output = RunCommandCapture(Command("--help"));
    EXPECT_NE(output.find("Usage:"), std::string::npos);
    EXPECT_NE(output.find("--scenario"), std::string::npos);
}

TEST(IntegrationTest, InvalidOptionsFailWithMessage) {
    const std::string unknown = RunCommandCapture(Command("--verbose 2>&1; echo \"rc=$?\""));
    EXPECT_NE(unknown.find("Unknown option: --verbose"), std::string::npos);
    EXPECT_NE(unknown.find("rc=1"), std::string::npos);

    const std::string mismatch = RunCommandCapture(Command("--scenario muon --pion-charge 1 2>&1 || true"));
    EXPECT_NE(mismatch.find("--pion-charge requires --scenario pion"), std::string::npos);
}
