#include <simlens/server/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace simlens::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>         Path to YAML config file\n"
            << "  --host <addr>               Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>           Listen port (default: 8080)\n"
            << "  --threads <n>               I/O threads (default: auto)\n"
            << "  --workers <n>               Comparison worker threads (default: 16)\n"
            << "  --log-level <level>         Log level: debug, info, warn, error\n"
            << "  --oracle-api-key <key>      Gemini API key (default: $GEMINI_API_KEY)\n"
            << "  --oracle-model <name>       Gemini model (default: gemini-1.5-flash)\n"
            << "  --oracle-base-url <url>     Gemini API base URL\n"
            << "  --oracle-timeout-ms <ms>    Oracle request timeout (default: 30000)\n"
            << "  --no-semantic               Skip semantic analysis unless requested\n"
            << "  --env-file <path>           dotenv file to read the API key from (default: .env)\n"
            << "  --help, -h                  Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --port 8080\n"
            << "  " << argv0 << " --config /etc/simlens/server.yaml\n"
            << "  GEMINI_API_KEY=... " << argv0 << " --oracle-timeout-ms 10000\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

// std::stoul with the offending key in the error message.
unsigned long ParseUnsigned(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    unsigned long parsed = std::stoul(value, &consumed);
    if (consumed != value.size() || value[0] == '-') {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
}

uint32_t ParseUint32(const std::string& key, const std::string& value) {
  unsigned long parsed = ParseUnsigned(key, value);
  if (parsed > std::numeric_limits<uint32_t>::max()) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
  return static_cast<uint32_t>(parsed);
}

uint16_t ParsePort(const std::string& key, const std::string& value) {
  unsigned long port = ParseUnsigned(key, value);
  if (port > 65535) {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<uint16_t>(port);
}

}  // namespace

std::string ReadEnvFileValue(const std::string& path, const std::string& key) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return "";
  }

  std::string line;
  while (std::getline(file, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line.compare(0, 7, "export ") == 0) {
      line = Trim(line.substr(7));
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos || Trim(line.substr(0, eq)) != key) {
      continue;
    }

    std::string value = Trim(line.substr(eq + 1));
    if (!value.empty() && value.front() != '"' && value.front() != '\'') {
      // Unquoted values end at an inline comment
      size_t hash = value.find(" #");
      if (hash != std::string::npos) value = Trim(value.substr(0, hash));
    }
    return Unquote(value);
  }
  return "";
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    value = Unquote(value);

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = ParsePort("server.port", value);
      } else if (key == "threads") {
        config.server.threads = ParseUint32("server.threads", value);
      } else if (key == "workers") {
        config.server.workers = ParseUint32("server.workers", value);
      } else if (key == "log_level") {
        config.server.log_level = value;
      }
    } else if (current_section == "oracle") {
      auto& oracle = config.semantic.oracle;
      if (key == "api_key") {
        oracle.api_key = value;
      } else if (key == "base_url") {
        oracle.base_url = value;
      } else if (key == "model") {
        oracle.model = value;
      } else if (key == "timeout_ms") {
        oracle.timeout_ms = ParseUint32("oracle.timeout_ms", value);
      } else if (key == "analysis_prefix_chars") {
        oracle.analysis_prefix_chars = ParseUnsigned("oracle.analysis_prefix_chars", value);
      } else if (key == "suggestion_prefix_chars") {
        oracle.suggestion_prefix_chars = ParseUnsigned("oracle.suggestion_prefix_chars", value);
      } else if (key == "enrich") {
        config.semantic.enrich = ParseBool(value);
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "env_file") {
        config.env_file = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;
  std::string config_file;
  bool no_semantic = false;

  auto next_value = [&](int* i, const std::string& flag, const char* what) -> std::string {
    if (++*i >= argc) {
      throw std::runtime_error(flag + " requires " + what);
    }
    return argv[*i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      config_file = next_value(&i, arg, "a path argument");
    } else if (arg == "--host") {
      config.server.host = next_value(&i, arg, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      config.server.port = ParsePort("--port", next_value(&i, arg, "a port number"));
    } else if (arg == "--threads") {
      config.server.threads = ParseUint32("--threads", next_value(&i, arg, "a number"));
    } else if (arg == "--workers") {
      config.server.workers = ParseUint32("--workers", next_value(&i, arg, "a number"));
    } else if (arg == "--log-level") {
      config.server.log_level = next_value(&i, arg, "a level");
    } else if (arg == "--oracle-api-key") {
      config.semantic.oracle.api_key = next_value(&i, arg, "a key");
    } else if (arg == "--oracle-model") {
      config.semantic.oracle.model = next_value(&i, arg, "a model name");
    } else if (arg == "--oracle-base-url") {
      config.semantic.oracle.base_url = next_value(&i, arg, "a URL");
    } else if (arg == "--oracle-timeout-ms") {
      config.semantic.oracle.timeout_ms =
          ParseUint32("--oracle-timeout-ms", next_value(&i, arg, "a number"));
    } else if (arg == "--no-semantic") {
      no_semantic = true;
    } else if (arg == "--env-file") {
      config.env_file = next_value(&i, arg, "a path");
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  // If a config file was specified, load it first then override with CLI args
  if (!config_file.empty()) {
    Config file_config = LoadFromFile(config_file);
    const Config defaults;

    if (config.server.host == defaults.server.host) {
      config.server.host = file_config.server.host;
    }
    if (config.server.port == defaults.server.port) {
      config.server.port = file_config.server.port;
    }
    if (config.server.threads == defaults.server.threads) {
      config.server.threads = file_config.server.threads;
    }
    if (config.server.workers == defaults.server.workers) {
      config.server.workers = file_config.server.workers;
    }
    if (config.server.log_level == defaults.server.log_level) {
      config.server.log_level = file_config.server.log_level;
    }

    auto& oracle = config.semantic.oracle;
    const auto& file_oracle = file_config.semantic.oracle;
    if (oracle.api_key.empty()) {
      oracle.api_key = file_oracle.api_key;
    }
    if (oracle.base_url == defaults.semantic.oracle.base_url) {
      oracle.base_url = file_oracle.base_url;
    }
    if (oracle.model == defaults.semantic.oracle.model) {
      oracle.model = file_oracle.model;
    }
    if (oracle.timeout_ms == defaults.semantic.oracle.timeout_ms) {
      oracle.timeout_ms = file_oracle.timeout_ms;
    }
    if (config.env_file == defaults.env_file) {
      config.env_file = file_config.env_file;
    }

    // File-only settings
    oracle.analysis_prefix_chars = file_oracle.analysis_prefix_chars;
    oracle.suggestion_prefix_chars = file_oracle.suggestion_prefix_chars;
    config.semantic.enrich = file_config.semantic.enrich;
    config.metrics = file_config.metrics;
  }

  if (no_semantic) {
    config.semantic.enrich = false;
  }

  // Credential lookup: flag / file, then environment, then env file
  if (config.semantic.oracle.api_key.empty()) {
    const char* from_env = std::getenv(kApiKeyVariable);
    if (from_env && *from_env) {
      config.semantic.oracle.api_key = from_env;
    } else if (!config.env_file.empty()) {
      config.semantic.oracle.api_key = ReadEnvFileValue(config.env_file, kApiKeyVariable);
    }
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  if (server.workers == 0) {
    throw std::runtime_error("server.workers must be positive");
  }

  // Validate log level
  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  const auto& oracle = semantic.oracle;
  if (oracle.timeout_ms == 0) {
    throw std::runtime_error("oracle.timeout_ms must be positive");
  }
  if (oracle.analysis_prefix_chars == 0 || oracle.suggestion_prefix_chars == 0) {
    throw std::runtime_error("oracle prefix lengths must be positive");
  }
  if (oracle.IsConfigured() && oracle.base_url.empty()) {
    throw std::runtime_error("oracle.base_url is required when an API key is set");
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
  }
}

}  // namespace simlens::server
