#include "config/env_file.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string_view>
#include <utility>

namespace binpost::config {

namespace {

std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1U])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

std::string StripMatchingQuotes(std::string value) {
  if (value.size() >= 2U) {
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
      return value.substr(1U, value.size() - 2U);
    }
  }
  return value;
}

std::string Lookup(const EnvMap& env, const std::string& key) {
  const auto it = env.find(key);
  if (it == env.end()) {
    return "";
  }
  return it->second;
}

template <typename T>
bool ParseUnsigned(const std::string& raw, const std::string& key, T& value, std::string& error) {
  std::uint64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || parsed > std::numeric_limits<T>::max()) {
    error = "invalid numeric value for " + key + ": '" + raw + "'";
    return false;
  }
  value = static_cast<T>(parsed);
  return true;
}

bool ParseBool(const std::string& raw, const std::string& key, bool& value, std::string& error) {
  std::string lowered = raw;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
    value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
    value = false;
    return true;
  }
  error = "invalid boolean value for " + key + ": '" + raw + "'";
  return false;
}

bool IsPlaceholderValue(const std::string& key, const std::string& value) {
  if (key == "NNTP_HOST") {
    return value == "news.example.com";
  }
  if (key == "NNTP_USER") {
    return value == "seu_usuario" || value == "your_username";
  }
  return false;
}

} // namespace

const std::vector<std::string>& RequiredCredentialKeys() {
  static const std::vector<std::string> kKeys = {"NNTP_HOST", "NNTP_PORT", "NNTP_USER",
                                                 "NNTP_PASS"};
  return kKeys;
}

bool LoadEnvFile(const std::filesystem::path& path, EnvMap& env, std::string& error) {
  env.clear();
  std::ifstream input(path);
  if (!input) {
    error = "unable to open credential file: " + path.string();
    return false;
  }

  EnvMap parsed;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const std::size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      error = "malformed line " + std::to_string(line_number) + " in " + path.string() +
              " (expected KEY=VALUE)";
      return false;
    }

    std::string key = Trim(std::string_view(trimmed).substr(0, eq));
    if (key.empty()) {
      error = "empty key on line " + std::to_string(line_number) + " in " + path.string();
      return false;
    }
    parsed[key] = StripMatchingQuotes(Trim(std::string_view(trimmed).substr(eq + 1U)));
  }

  env = std::move(parsed);
  return true;
}

bool BuildTransmitCredentials(const EnvMap& env, TransmitCredentials& credentials,
                              std::string& error) {
  std::string missing;
  for (const auto& key : RequiredCredentialKeys()) {
    if (Lookup(env, key).empty()) {
      missing += missing.empty() ? key : ", " + key;
    }
  }
  if (!missing.empty()) {
    error = "credential file is missing required keys: " + missing;
    return false;
  }

  for (const auto& key : {std::string("NNTP_HOST"), std::string("NNTP_USER")}) {
    if (IsPlaceholderValue(key, Lookup(env, key))) {
      error = "credential file still contains the example value for " + key;
      return false;
    }
  }

  TransmitCredentials parsed;
  parsed.host = Lookup(env, "NNTP_HOST");
  parsed.user = Lookup(env, "NNTP_USER");
  parsed.password = Lookup(env, "NNTP_PASS");
  parsed.group = Lookup(env, "USENET_GROUP");

  if (!ParseUnsigned(Lookup(env, "NNTP_PORT"), "NNTP_PORT", parsed.port, error)) {
    return false;
  }

  const std::string ssl = Lookup(env, "NNTP_SSL");
  if (!ssl.empty() && !ParseBool(ssl, "NNTP_SSL", parsed.ssl, error)) {
    return false;
  }

  const std::string connections = Lookup(env, "NNTP_CONNECTIONS");
  if (!connections.empty() &&
      !ParseUnsigned(connections, "NNTP_CONNECTIONS", parsed.connections, error)) {
    return false;
  }

  const std::string article_size = Lookup(env, "ARTICLE_SIZE");
  if (!article_size.empty()) {
    std::uint64_t ignored = 0;
    if (!ParseSizeString(article_size, ignored, error)) {
      error = "invalid ARTICLE_SIZE: " + error;
      return false;
    }
    parsed.article_size = article_size;
  }

  credentials = std::move(parsed);
  return true;
}

} // namespace binpost::config
