#include "bubble/cli_options.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <string_view>

namespace bubble {
namespace {

enum class OptionResult : uint8_t {
    Consumed = 0,
    NotMatched = 1,
    Failed = 2,
};

void SetError(std::string* errorOut, const std::string& message) {
    if (errorOut != nullptr) {
        *errorOut = message;
    }
}

// Options shared by the generator CLI and the viewer.
OptionResult ParseGeneratorOption(
    std::string_view arg,
    int argc,
    char** argv,
    int* index,
    GeneratorConfig* config,
    std::string* errorOut) {
    auto needValue = [&](const char* optionName) -> const char* {
        if (*index + 1 >= argc) {
            SetError(errorOut, std::string("Missing value for ") + optionName);
            return nullptr;
        }
        return argv[++*index];
    };

    if (arg == "--scenario") {
        const char* value = needValue("--scenario");
        if (value == nullptr) {
            return OptionResult::Failed;
        }
        Scenario scenario;
        if (!ParseScenario(value, &scenario)) {
            SetError(errorOut, std::string("Invalid scenario: ") + value);
            return OptionResult::Failed;
        }
        config->scenario = scenario;
        return OptionResult::Consumed;
    }
    if (arg == "--pion-charge") {
        const char* value = needValue("--pion-charge");
        if (value == nullptr) {
            return OptionResult::Failed;
        }
        int charge = 0;
        if (!ParsePionCharge(value, &charge)) {
            SetError(errorOut, std::string("Invalid pion charge: ") + value);
            return OptionResult::Failed;
        }
        config->pionCharge = charge;
        return OptionResult::Consumed;
    }
    if (arg == "--seed") {
        const char* value = needValue("--seed");
        if (value == nullptr) {
            return OptionResult::Failed;
        }
        uint32_t seed = 0;
        if (!ParseUInt32(value, &seed)) {
            SetError(errorOut, std::string("Invalid seed: ") + value);
            return OptionResult::Failed;
        }
        config->seed = seed;
        return OptionResult::Consumed;
    }
    return OptionResult::NotMatched;
}

bool CheckPionChargeScenario(const GeneratorConfig& config, std::string* errorOut) {
    if (config.pionCharge.has_value() && config.scenario != Scenario::PionDecay) {
        SetError(errorOut, "--pion-charge requires --scenario pion");
        return false;
    }
    return true;
}

}  // namespace

bool ParseUInt32(const char* text, uint32_t* outValue) {
    char* end = nullptr;
    errno = 0;
    const unsigned long parsed = std::strtoul(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || text[0] == '-' ||
        parsed > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    *outValue = static_cast<uint32_t>(parsed);
    return true;
}

bool ParseInt(const char* text, int* outValue) {
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || parsed < std::numeric_limits<int>::min() ||
        parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    *outValue = static_cast<int>(parsed);
    return true;
}

bool ParseCliArgs(int argc, char** argv, CliOptions* outOptions, std::string* errorOut) {
    if (outOptions == nullptr) {
        SetError(errorOut, "Internal error: outOptions is null");
        return false;
    }

    CliOptions parsed;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--help") {
            outOptions->helpRequested = true;
            return false;
        }

        const OptionResult common = ParseGeneratorOption(arg, argc, argv, &i, &parsed.config, errorOut);
        if (common == OptionResult::Failed) {
            return false;
        }
        if (common == OptionResult::Consumed) {
            continue;
        }

        if (arg == "--events") {
            if (i + 1 >= argc) {
                SetError(errorOut, "Missing value for --events");
                return false;
            }
            const char* value = argv[++i];
            int events = 0;
            if (!ParseInt(value, &events) || events <= 0) {
                SetError(errorOut, std::string("Invalid event count: ") + value);
                return false;
            }
            parsed.eventCount = events;
            continue;
        }

        SetError(errorOut, std::string("Unknown option: ") + std::string(arg));
        return false;
    }

    if (!CheckPionChargeScenario(parsed.config, errorOut)) {
        return false;
    }
    *outOptions = parsed;
    return true;
}

bool ParseViewerCliArgs(int argc, char** argv, ViewerCliOptions* outOptions, std::string* errorOut) {
    if (outOptions == nullptr) {
        SetError(errorOut, "Internal error: outOptions is null");
        return false;
    }

    ViewerCliOptions parsed;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--help") {
            outOptions->helpRequested = true;
            return false;
        }

        const OptionResult common = ParseGeneratorOption(arg, argc, argv, &i, &parsed.config, errorOut);
        if (common == OptionResult::Failed) {
            return false;
        }
        if (common == OptionResult::Consumed) {
            continue;
        }

        SetError(errorOut, std::string("Unknown option: ") + std::string(arg));
        return false;
    }

    if (!CheckPionChargeScenario(parsed.config, errorOut)) {
        return false;
    }
    *outOptions = parsed;
    return true;
}

void PrintUsage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " [options]\n"
        << "  --scenario <pp|neutron|muon|pion|photon>\n"
        << "  --pion-charge <-1|0|1>   (pion scenario only)\n"
        << "  --seed <uint32>\n"
        << "  --events <N>\n"
        << "  --help\n";
}

void PrintViewerUsage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " [options]\n"
        << "  --scenario <pp|neutron|muon|pion|photon>\n"
        << "  --pion-charge <-1|0|1>   (pion scenario only)\n"
        << "  --seed <uint32>\n"
        << "  --help\n";
}

}  // namespace bubble
