#include <simlens/server/handlers.hpp>
#include <simlens/version.hpp>

#include <drogon/drogon.h>

#include <functional>
#include <memory>
#include <sstream>

namespace simlens::server {

namespace {

const char* OracleOutcome(bool fallback) { return fallback ? "fallback" : "ok"; }

// Drogon only parses bodies sent as application/json; accept any
// content type the way curl users tend to send it.
std::shared_ptr<Json::Value> ParseBody(const drogon::HttpRequestPtr& req) {
  auto json = req->getJsonObject();
  if (json) {
    return json;
  }

  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream{std::string(req->body())};
  if (Json::parseFromStream(builder, stream, &parsed, &errors)) {
    return std::make_shared<Json::Value>(parsed);
  }
  return nullptr;
}

}  // namespace

// --- Request Validation ---

bool ParseCompareRequest(const Json::Value& body,
                         bool default_semantic,
                         CompareRequest* request,
                         std::string* error_out) {
  if (!body.isObject()) {
    if (error_out) *error_out = "Request body must be a JSON object";
    return false;
  }

  const Json::Value& text1 = body["text1"];
  const Json::Value& text2 = body["text2"];

  // Missing texts count as blank, so the caller reports them like blank input.
  if ((!text1.isNull() && !text1.isString()) || (!text2.isNull() && !text2.isString())) {
    if (error_out) *error_out = "text1 and text2 must be strings";
    return false;
  }

  const Json::Value& semantic = body["semantic"];
  if (!semantic.isNull() && !semantic.isBool()) {
    if (error_out) *error_out = "semantic must be a boolean";
    return false;
  }

  request->text1 = text1.isString() ? text1.asString() : "";
  request->text2 = text2.isString() ? text2.asString() : "";
  request->options.semantic = semantic.isBool() ? semantic.asBool() : default_semantic;
  return true;
}

// --- Error Response Helper ---

drogon::HttpResponsePtr MakeErrorResponse(const std::string& message,
                                          drogon::HttpStatusCode code) {
  Json::Value json;
  json["error"] = message;

  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

// --- Handler Registration ---

void RegisterHandlers(std::shared_ptr<const Comparator> comparator,
                      const Config& config,
                      std::shared_ptr<ServiceMetrics> metrics,
                      std::shared_ptr<trantor::ConcurrentTaskQueue> workers) {
  auto& app = drogon::app();
  const bool default_semantic = config.semantic.enrich;

  // POST /compare - Compare two texts
  app.registerHandler(
      "/compare",
      [comparator, metrics, workers, default_semantic](
          const drogon::HttpRequestPtr& req,
          std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        auto timer = std::make_shared<RequestTimer>(metrics, "POST", "/compare");

        using Respond = std::function<void(const drogon::HttpResponsePtr&)>;
        auto reject = [metrics, timer](const std::string& message, const Respond& respond) {
          if (metrics) metrics->RecordInvalidRequest();
          timer->SetStatusCode(400);
          respond(MakeErrorResponse(message, drogon::k400BadRequest));
        };

        auto body = ParseBody(req);
        if (!body) {
          reject("Request body must be a JSON object", callback);
          return;
        }

        CompareRequest request;
        std::string error;
        if (!ParseCompareRequest(*body, default_semantic, &request, &error)) {
          reject(error, callback);
          return;
        }

        // Oracle calls block; keep them off the I/O loop.
        std::function<void()> task = [comparator, metrics, timer, reject,
                                      request = std::move(request),
                                      callback = std::move(callback)]() {
          SimilarityReport report;
          std::string error;
          if (!comparator->Compare(request.text1, request.text2, request.options,
                                   &report, &error)) {
            reject(error, callback);
            return;
          }

          if (metrics) {
            metrics->RecordComparison();
            if (report.semantic) {
              metrics->RecordOracleCall("analysis", OracleOutcome(report.semantic->IsFallback()));
            }
            if (report.suggestions) {
              metrics->RecordOracleCall("suggestions",
                                        OracleOutcome(report.suggestions->IsFallback()));
            }
          }

          auto resp = drogon::HttpResponse::newHttpJsonResponse(ToJson(report));
          resp->setStatusCode(drogon::k200OK);
          callback(resp);
        };

        if (workers) {
          workers->runTaskInQueue(std::move(task));
        } else {
          task();
        }
      },
      {drogon::Post});

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [comparator, metrics](const drogon::HttpRequestPtr& req,
                            std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        RequestTimer timer(metrics, "GET", "/health");

        Json::Value json;
        json["status"] = "healthy";
        json["gemini_configured"] = comparator->oracle().IsConfigured();
        json["version"] = Version();

        auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

}  // namespace simlens::server
