#pragma once

#include <simlens/oracle_client.hpp>

#include <cstdint>
#include <string>

namespace simlens::server {

/**
 * Server configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;   // I/O threads; 0 = auto-detect CPU cores
  uint32_t workers = 16;  // Comparisons (and their oracle calls) run here
  std::string log_level = "info";
};

/**
 * Semantic enrichment configuration.
 */
struct SemanticConfig {
  OracleConfig oracle;
  bool enrich = true;  // Default for requests that do not say "semantic"
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

// Environment variable (and .env key) holding the oracle API key.
constexpr const char* kApiKeyVariable = "GEMINI_API_KEY";

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  SemanticConfig semantic;
  MetricsConfig metrics;
  std::string env_file = ".env";

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   *
   * A --config file is loaded first and CLI values override it. If no API
   * key was given, GEMINI_API_KEY is taken from the environment, then from
   * the env file.
   *
   * @param argc Argument count
   * @param argv Argument values
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

/**
 * Read one variable from a dotenv-style file (KEY=VALUE lines, optional
 * "export " prefix, optional quotes, '#' comments).
 *
 * @return The value, or an empty string if the file or key is missing
 */
std::string ReadEnvFileValue(const std::string& path, const std::string& key);

}  // namespace simlens::server
