#include <simlens/oracle_client.hpp>
#include <simlens/normalize.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace simlens {

namespace internal {

// Analysis prompt. The reply is expected to embed a JSON object with the
// fields of SemanticAnalysis; anything else is handled as a fallback.
constexpr const char* kAnalysisPromptTemplate = R"(
Analyze the similarity between these two texts and provide a comprehensive analysis:

Text 1: "{text1}..."

Text 2: "{text2}..."

Please provide:
1. A similarity score from 0.0 to 1.0 based on semantic meaning
2. Key insights about the relationship between the texts
3. What makes them similar or different
4. The main themes or topics in each text
5. Any notable patterns or writing styles

Format your response as JSON with these fields:
{
    "semantic_similarity": <float between 0.0 and 1.0>,
    "insights": "<string with analysis>",
    "themes_text1": ["<theme1>", "<theme2>"],
    "themes_text2": ["<theme1>", "<theme2>"],
    "key_differences": "<string>",
    "writing_style_comparison": "<string>"
}
)";

constexpr const char* kSuggestionPromptTemplate = R"(
Based on these similarity metrics between two texts:
- Cosine Similarity: {cosine}
- Character Similarity: {character}
- Jaccard Index: {jaccard}
- Word Overlap: {overlap}%

Text 1: "{text1}..."
Text 2: "{text2}..."

Provide 3 specific suggestions for improving text similarity if that was the goal.
Keep each suggestion under 50 words and focus on practical writing tips.
Format as a simple numbered list.
)";

namespace {

using Substitutions = std::vector<std::pair<std::string_view, std::string>>;

// Single pass over the template: each "{name}" with a known name is
// replaced, every other character (including JSON braces) is copied.
// Substituted text is never rescanned.
std::string FillTemplate(std::string_view tmpl, const Substitutions& values) {
  std::string out;
  out.reserve(tmpl.size() + 1024);

  size_t i = 0;
  while (i < tmpl.size()) {
    bool replaced = false;
    if (tmpl[i] == '{') {
      for (const auto& [name, value] : values) {
        if (tmpl.compare(i, name.size(), name) == 0) {
          out += value;
          i += name.size();
          replaced = true;
          break;
        }
      }
    }
    if (!replaced) {
      out += tmpl[i++];
    }
  }
  return out;
}

std::string FormatFixed(double value, int precision) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << value;
  return ss.str();
}

}  // namespace

std::string FormatAnalysisPrompt(std::string_view text1, std::string_view text2) {
  return FillTemplate(kAnalysisPromptTemplate, {
      {"{text1}", std::string(text1)},
      {"{text2}", std::string(text2)},
  });
}

std::string FormatSuggestionPrompt(std::string_view text1,
                                   std::string_view text2,
                                   const SimilarityScores& scores) {
  return FillTemplate(kSuggestionPromptTemplate, {
      {"{cosine}", FormatFixed(scores.cosine_similarity, 3)},
      {"{character}", FormatFixed(scores.character_similarity, 3)},
      {"{jaccard}", FormatFixed(scores.jaccard_index, 3)},
      {"{overlap}", FormatFixed(scores.word_overlap, 1)},
      {"{text1}", std::string(text1)},
      {"{text2}", std::string(text2)},
  });
}

std::string BuildGenerateContentBody(const std::string& prompt) {
  Json::Value part;
  part["text"] = prompt;

  Json::Value content;
  content["parts"].append(part);

  Json::Value body;
  body["contents"].append(content);

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, body);
}

bool ExtractCandidateText(std::string_view body, std::string* text_out) {
  Json::Value root;
  std::string errors;
  if (!ParseJsonDocument(body, &root, &errors)) {
    return false;
  }
  if (!root.isObject()) return false;

  const Json::Value& envelope = root;
  const Json::Value& candidates = envelope["candidates"];
  if (!candidates.isArray() || candidates.empty()) return false;

  const Json::Value& first = candidates[0];
  if (!first.isObject()) return false;
  const Json::Value& content = first["content"];
  if (!content.isObject()) return false;
  const Json::Value& parts = content["parts"];
  if (!parts.isArray() || parts.empty()) return false;
  const Json::Value& part = parts[0];
  if (!part.isObject() || !part["text"].isString()) return false;

  *text_out = part["text"].asString();
  return true;
}

}  // namespace internal

const char* OracleStatusName(OracleStatus status) {
  switch (status) {
    case OracleStatus::kOk:
      return "ok";
    case OracleStatus::kNotConfigured:
      return "not configured";
    case OracleStatus::kTransportFailure:
      return "transport failure";
    case OracleStatus::kTimeout:
      return "timeout";
    case OracleStatus::kHttpError:
      return "http error";
    case OracleStatus::kEmptyReply:
      return "empty reply";
  }
  return "unknown";
}

namespace {

std::string DescribeFailure(const OracleReply& reply) {
  std::string reason = OracleStatusName(reply.status);
  if (!reply.error_message.empty()) {
    reason += ": " + reply.error_message;
  }
  return reason;
}

}  // namespace

OracleClient::OracleClient(OracleConfig config,
                           std::shared_ptr<const OracleTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (!transport_ && config_.IsConfigured()) {
    transport_ = CreateHttpTransport(config_.base_url);
  }
}

std::string OracleClient::RequestPath() const {
  return "/v1beta/models/" + config_.model + ":generateContent";
}

OracleReply OracleClient::Generate(const std::string& prompt) const {
  OracleReply reply;

  if (!config_.IsConfigured() || !transport_) {
    reply.status = OracleStatus::kNotConfigured;
    return reply;
  }

  OracleTransport::Headers headers = {
      {"x-goog-api-key", config_.api_key},
  };
  auto response = transport_->Post(RequestPath(),
                                   internal::BuildGenerateContentBody(prompt),
                                   headers,
                                   config_.timeout_ms / 1000.0);

  switch (response.result) {
    case TransportResponse::Result::kTimeout:
      reply.status = OracleStatus::kTimeout;
      reply.error_message = response.error_message;
      LOG_WARN << "Oracle request timed out after " << config_.timeout_ms << "ms";
      return reply;
    case TransportResponse::Result::kFailure:
      reply.status = OracleStatus::kTransportFailure;
      reply.error_message = response.error_message;
      LOG_WARN << "Oracle request failed: " << response.error_message;
      return reply;
    case TransportResponse::Result::kOk:
      break;
  }

  reply.http_status = response.status_code;
  if (response.status_code != 200) {
    reply.status = OracleStatus::kHttpError;
    reply.error_message = "status " + std::to_string(response.status_code);
    LOG_WARN << "Oracle error: " << response.status_code << " - " << response.body;
    return reply;
  }

  if (!internal::ExtractCandidateText(response.body, &reply.text)) {
    reply.status = OracleStatus::kEmptyReply;
    reply.error_message = "no candidate text in response";
    LOG_WARN << "Oracle response had no candidate text";
    return reply;
  }

  reply.status = OracleStatus::kOk;
  return reply;
}

SemanticAnalysis OracleClient::Analyze(std::string_view text1, std::string_view text2) const {
  if (!IsConfigured()) {
    return MakeFallbackAnalysis(OracleStatusName(OracleStatus::kNotConfigured), "");
  }

  std::string prompt = internal::FormatAnalysisPrompt(
      internal::TruncateCodePoints(text1, config_.analysis_prefix_chars),
      internal::TruncateCodePoints(text2, config_.analysis_prefix_chars));

  OracleReply reply = Generate(prompt);
  if (!reply.ok()) {
    return MakeFallbackAnalysis(DescribeFailure(reply), "");
  }

  SemanticAnalysis analysis;
  std::string parse_error;
  if (!internal::ParseSemanticAnalysis(reply.text, &analysis, &parse_error)) {
    LOG_DEBUG << "Oracle analysis not structured: " << parse_error;
    return MakeFallbackAnalysis("unparseable reply: " + parse_error, std::move(reply.text));
  }
  return analysis;
}

ImprovementSuggestions OracleClient::Suggest(std::string_view text1,
                                             std::string_view text2,
                                             const SimilarityScores& scores) const {
  if (!IsConfigured()) {
    return MakeFallbackSuggestions(OracleStatusName(OracleStatus::kNotConfigured));
  }

  std::string prompt = internal::FormatSuggestionPrompt(
      internal::TruncateCodePoints(text1, config_.suggestion_prefix_chars),
      internal::TruncateCodePoints(text2, config_.suggestion_prefix_chars),
      scores);

  OracleReply reply = Generate(prompt);
  if (!reply.ok()) {
    return MakeFallbackSuggestions(DescribeFailure(reply));
  }
  if (reply.text.empty()) {
    return MakeFallbackSuggestions(OracleStatusName(OracleStatus::kEmptyReply));
  }

  ImprovementSuggestions suggestions;
  suggestions.source = AnalysisSource::kOracle;
  suggestions.text = std::move(reply.text);
  return suggestions;
}

}  // namespace simlens
