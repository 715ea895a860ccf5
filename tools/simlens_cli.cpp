#include <simlens/comparator.hpp>

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [--semantic] [--api-key <key>] <file1> <file2>\n"
      << "  " << argv0 << " [--semantic] [--api-key <key>] --text <text1> <text2>\n"
      << "\n"
      << "The API key defaults to $GEMINI_API_KEY. Without one, --semantic\n"
      << "reports the fallback analysis.\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  *out = buffer.str();
  return true;
}

int main(int argc, char** argv) {
  simlens::CompareOptions options;
  simlens::OracleConfig oracle_config;
  bool literal = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      usage(argv[0]);
      return 0;
    } else if (arg == "--semantic") {
      options.semantic = true;
    } else if (arg == "--text") {
      literal = true;
    } else if (arg == "--api-key") {
      if (++i >= argc) { usage(argv[0]); return 2; }
      oracle_config.api_key = argv[i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      usage(argv[0]);
      return 2;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) { usage(argv[0]); return 2; }

  if (oracle_config.api_key.empty()) {
    const char* from_env = std::getenv("GEMINI_API_KEY");
    if (from_env) oracle_config.api_key = from_env;
  }

  std::string text1 = positional[0];
  std::string text2 = positional[1];
  if (!literal) {
    for (int n = 0; n < 2; ++n) {
      std::string& text = n == 0 ? text1 : text2;
      if (!ReadFile(positional[n], &text)) {
        std::cerr << "Cannot read " << positional[n] << "\n";
        return 2;
      }
    }
  }

  simlens::Comparator comparator(std::make_shared<simlens::OracleClient>(oracle_config));
  simlens::SimilarityReport report;
  std::string error;
  if (!comparator.Compare(text1, text2, options, &report, &error)) {
    std::cerr << "Compare failed: " << error << "\n";
    return 1;
  }

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  std::cout << Json::writeString(writer, simlens::ToJson(report)) << "\n";
  return 0;
}
