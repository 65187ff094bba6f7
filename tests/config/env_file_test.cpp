#include "config/env_file.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace binpost::config;

TEST_CASE("Env files parse comments, quotes and whitespace", "[config][env]") {
  const fs::path root = binpost::tests::common::CreateUniqueTempDir("binpost-env");
  const fs::path env_path = root / ".env";
  binpost::tests::common::WriteFile(env_path, "# server settings\n"
                                              "\n"
                                              "NNTP_HOST = news.test.invalid\n"
                                              "NNTP_PASS=\"a=b c\"\n"
                                              "  USENET_GROUP='alt.binaries.test'  \n"
                                              "EMPTY=\n");
  EnvMap env;
  std::string error;
  REQUIRE(LoadEnvFile(env_path, env, error));
  REQUIRE(env.size() == 4U);
  REQUIRE(env.at("NNTP_HOST") == "news.test.invalid");
  REQUIRE(env.at("NNTP_PASS") == "a=b c");
  REQUIRE(env.at("USENET_GROUP") == "alt.binaries.test");
  REQUIRE(env.at("EMPTY").empty());

  binpost::tests::common::WriteFile(env_path, "NNTP_HOST=x\nnot a pair\n");
  REQUIRE_FALSE(LoadEnvFile(env_path, env, error));
  REQUIRE(error.find("malformed line 2") != std::string::npos);
  REQUIRE(env.empty());

  REQUIRE_FALSE(LoadEnvFile(root / "absent.env", env, error));
  REQUIRE(error.find("unable to open credential file") != std::string::npos);

  binpost::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Credentials apply defaults for optional keys", "[config][env]") {
  const EnvMap env = {{"NNTP_HOST", "news.test.invalid"},
                      {"NNTP_PORT", "119"},
                      {"NNTP_USER", "tester"},
                      {"NNTP_PASS", "secret"}};
  TransmitCredentials credentials;
  std::string error;
  REQUIRE(BuildTransmitCredentials(env, credentials, error));
  REQUIRE(credentials.host == "news.test.invalid");
  REQUIRE(credentials.port == 119U);
  REQUIRE(credentials.ssl);
  REQUIRE(credentials.connections == 50U);
  REQUIRE(credentials.article_size == "700K");
  REQUIRE(credentials.group.empty());
}

TEST_CASE("Credentials honor optional overrides", "[config][env]") {
  const EnvMap env = {{"NNTP_HOST", "news.test.invalid"}, {"NNTP_PORT", "563"},
                      {"NNTP_USER", "tester"},            {"NNTP_PASS", "secret"},
                      {"NNTP_SSL", "false"},              {"NNTP_CONNECTIONS", "8"},
                      {"ARTICLE_SIZE", "750K"},           {"USENET_GROUP", "alt.binaries.x"}};
  TransmitCredentials credentials;
  std::string error;
  REQUIRE(BuildTransmitCredentials(env, credentials, error));
  REQUIRE_FALSE(credentials.ssl);
  REQUIRE(credentials.connections == 8U);
  REQUIRE(credentials.article_size == "750K");
  REQUIRE(credentials.group == "alt.binaries.x");
}

TEST_CASE("Credential errors name the offending key", "[config][env]") {
  TransmitCredentials credentials;
  std::string error;

  REQUIRE_FALSE(BuildTransmitCredentials({{"NNTP_HOST", "h"}}, credentials, error));
  REQUIRE(error == "credential file is missing required keys: NNTP_PORT, NNTP_USER, NNTP_PASS");

  EnvMap env = {{"NNTP_HOST", "news.example.com"},
                {"NNTP_PORT", "563"},
                {"NNTP_USER", "tester"},
                {"NNTP_PASS", "secret"}};
  REQUIRE_FALSE(BuildTransmitCredentials(env, credentials, error));
  REQUIRE(error.find("example value for NNTP_HOST") != std::string::npos);

  env["NNTP_HOST"] = "news.test.invalid";
  env["NNTP_USER"] = "seu_usuario";
  REQUIRE_FALSE(BuildTransmitCredentials(env, credentials, error));
  REQUIRE(error.find("NNTP_USER") != std::string::npos);

  env["NNTP_USER"] = "tester";
  env["NNTP_PORT"] = "70000";
  REQUIRE_FALSE(BuildTransmitCredentials(env, credentials, error));
  REQUIRE(error.find("invalid numeric value for NNTP_PORT") != std::string::npos);

  env["NNTP_PORT"] = "563";
  env["NNTP_SSL"] = "maybe";
  REQUIRE_FALSE(BuildTransmitCredentials(env, credentials, error));

  env["NNTP_SSL"] = "yes";
  env["ARTICLE_SIZE"] = "huge";
  REQUIRE_FALSE(BuildTransmitCredentials(env, credentials, error));
  REQUIRE(error.find("invalid ARTICLE_SIZE") != std::string::npos);
}
