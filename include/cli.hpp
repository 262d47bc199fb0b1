#pragma once

#include "utils.hpp" // Config, LogLevel
#include <cxxopts.hpp>
#include <string>

namespace hbacc {

// Option groups of the hbacc command line
cxxopts::Options buildOptions();

// Command-line options override values loaded from a settings file
void applyOptions(const cxxopts::ParseResult& result, Config& config);

// Effective settings of a run: the --settings file, validated on its own,
// then the explicit options on top, validated again.
// Throws DescriptorException on an unreadable or invalid configuration.
Config resolveSettings(const cxxopts::ParseResult& result);

// --verbose wins over the configured level
LogLevel effectiveLogLevel(const Config& config);

// Writes `config` to the --save-settings path, if one was given
bool saveRequestedSettings(const cxxopts::ParseResult& result, const Config& config);

// --save-settings without -i and -o: save and exit
bool isSettingsOnlyRun(const cxxopts::ParseResult& result);

} // namespace hbacc
