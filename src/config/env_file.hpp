#pragma once

#include "config/run_config.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace binpost::config {

using EnvMap = std::map<std::string, std::string>;

// Keys that must be present and non-empty before anything is transmitted.
// USENET_GROUP is checked separately because `--group` can supply it.
const std::vector<std::string>& RequiredCredentialKeys();

// Parses a `.env`-style credential file:
// - `KEY=VALUE` per line, split on the first '='
// - blank lines and lines starting with '#' are ignored
// - surrounding whitespace is trimmed; one matching pair of quotes around the
//   value is stripped
//
// Returns false when the file cannot be opened or a non-comment line has no
// '='. `env` is left empty on failure.
bool LoadEnvFile(const std::filesystem::path& path, EnvMap& env, std::string& error);

// Maps credential keys onto TransmitCredentials. Fails on missing keys,
// unparseable numbers, and placeholder values copied from the example file.
bool BuildTransmitCredentials(const EnvMap& env, TransmitCredentials& credentials,
                              std::string& error);

} // namespace binpost::config
