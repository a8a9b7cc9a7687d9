#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

#include "bubble/config.hpp"

namespace bubble {

struct CliOptions {
    GeneratorConfig config;
    int eventCount = 1;
    bool helpRequested = false;
};

struct ViewerCliOptions {
    GeneratorConfig config;
    bool helpRequested = false;
};

bool ParseUInt32(const char* text, uint32_t* outValue);
bool ParseInt(const char* text, int* outValue);

// Returns false on error or --help; errorOut stays empty for --help.
bool ParseCliArgs(int argc, char** argv, CliOptions* outOptions, std::string* errorOut);
bool ParseViewerCliArgs(int argc, char** argv, ViewerCliOptions* outOptions, std::string* errorOut);

void PrintUsage(std::ostream& out, const char* argv0);
void PrintViewerUsage(std::ostream& out, const char* argv0);

}  // namespace bubble
