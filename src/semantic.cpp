#include <simlens/semantic.hpp>

#include <json/json.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace simlens {

namespace {

constexpr const char* kNoReplyInsights =
    "Unable to generate AI analysis. Please check your API key and internet connection.";
constexpr const char* kNoSuggestions =
    "No suggestions available. Please check your API key.";

// Render a JSON field as text: strings verbatim, other values as compact JSON.
std::string FieldAsText(const Json::Value& value) {
  if (value.isNull()) return "";
  if (value.isString()) return value.asString();

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

std::vector<std::string> FieldAsList(const Json::Value& value) {
  std::vector<std::string> out;
  if (value.isArray()) {
    for (const auto& item : value) {
      if (!item.isNull()) out.push_back(FieldAsText(item));
    }
  } else if (value.isString()) {
    out.push_back(value.asString());
  }
  return out;
}

bool CoerceScore(const Json::Value& value, double* out) {
  if (value.isBool()) {
    *out = value.asBool() ? 1.0 : 0.0;
    return true;
  }
  if (value.isNumeric()) {
    *out = value.asDouble();
  } else if (value.isString()) {
    std::string s = value.asString();
    try {
      size_t consumed = 0;
      *out = std::stod(s, &consumed);
      // Allow surrounding whitespace only
      if (s.find_first_not_of(" \t\r\n", consumed) != std::string::npos) {
        return false;
      }
    } catch (const std::invalid_argument&) {
      return false;
    } catch (const std::out_of_range&) {
      return false;
    }
  } else {
    return false;
  }
  return !std::isnan(*out);
}

}  // namespace

const char* AnalysisSourceName(AnalysisSource source) {
  switch (source) {
    case AnalysisSource::kOracle:
      return "oracle";
    case AnalysisSource::kFallback:
      return "fallback";
  }
  return "fallback";
}

namespace internal {

std::string_view ExtractEmbeddedJson(std::string_view text) {
  size_t start = text.find('{');
  size_t end = text.rfind('}');
  if (start == std::string_view::npos || end == std::string_view::npos || end < start) {
    return {};
  }
  return text.substr(start, end - start + 1);
}

bool ParseJsonDocument(std::string_view text, Json::Value* root, std::string* errors) {
  Json::CharReaderBuilder builder;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), root, errors);
}

bool ParseSemanticAnalysis(std::string_view reply,
                           SemanticAnalysis* out,
                           std::string* error_out) {
  std::string_view json_text = ExtractEmbeddedJson(reply);
  if (json_text.empty()) {
    if (error_out) *error_out = "no JSON object in reply";
    return false;
  }

  Json::Value root;
  std::string errors;
  if (!ParseJsonDocument(json_text, &root, &errors)) {
    if (error_out) *error_out = "invalid JSON in reply: " + errors;
    return false;
  }
  if (!root.isObject()) {
    if (error_out) *error_out = "reply JSON is not an object";
    return false;
  }

  const Json::Value& fields = root;
  double score = 0.0;
  if (!fields.isMember("semantic_similarity")) {
    if (error_out) *error_out = "reply JSON has no semantic_similarity";
    return false;
  }
  if (!CoerceScore(fields["semantic_similarity"], &score)) {
    if (error_out) *error_out = "semantic_similarity is not a number";
    return false;
  }

  SemanticAnalysis analysis;
  analysis.source = AnalysisSource::kOracle;
  analysis.semantic_similarity = std::clamp(score, 0.0, 1.0);
  analysis.insights = FieldAsText(fields["insights"]);
  analysis.themes_text1 = FieldAsList(fields["themes_text1"]);
  analysis.themes_text2 = FieldAsList(fields["themes_text2"]);
  analysis.key_differences = FieldAsText(fields["key_differences"]);
  analysis.writing_style_comparison = FieldAsText(fields["writing_style_comparison"]);

  *out = std::move(analysis);
  return true;
}

}  // namespace internal

SemanticAnalysis MakeFallbackAnalysis(std::string reason, std::string raw_reply) {
  SemanticAnalysis analysis;
  analysis.source = AnalysisSource::kFallback;
  analysis.fallback_reason = std::move(reason);
  analysis.semantic_similarity = kFallbackSimilarity;

  const char* theme = raw_reply.empty() ? "Analysis unavailable" : "General content";
  analysis.themes_text1 = {theme};
  analysis.themes_text2 = {theme};
  analysis.insights = raw_reply.empty() ? std::string(kNoReplyInsights) : std::move(raw_reply);
  analysis.key_differences = "Analysis could not be completed";
  analysis.writing_style_comparison = "Unable to compare writing styles";
  return analysis;
}

ImprovementSuggestions MakeFallbackSuggestions(std::string reason) {
  ImprovementSuggestions suggestions;
  suggestions.source = AnalysisSource::kFallback;
  suggestions.fallback_reason = std::move(reason);
  suggestions.text = kNoSuggestions;
  return suggestions;
}

}  // namespace simlens
