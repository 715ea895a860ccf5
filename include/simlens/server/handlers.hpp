#pragma once

#include <simlens/comparator.hpp>
#include <simlens/server/config.hpp>
#include <simlens/server/metrics.hpp>

#include <drogon/HttpAppFramework.h>
#include <trantor/utils/ConcurrentTaskQueue.h>
#include <json/json.h>

#include <memory>
#include <string>

namespace simlens::server {

/**
 * A validated /compare request body.
 */
struct CompareRequest {
  std::string text1;
  std::string text2;
  CompareOptions options;
};

/**
 * Validate a /compare body: a JSON object with string "text1" and "text2"
 * and an optional boolean "semantic" (defaulting to default_semantic).
 *
 * Blank texts pass here; Comparator::Compare rejects them.
 *
 * @return false with error_out set if the body has the wrong shape
 */
bool ParseCompareRequest(const Json::Value& body,
                         bool default_semantic,
                         CompareRequest* request,
                         std::string* error_out);

/**
 * Create a JSON error response: {"error": message}.
 */
drogon::HttpResponsePtr MakeErrorResponse(const std::string& message,
                                          drogon::HttpStatusCode code);

/**
 * Register the comparison and health handlers with the Drogon app.
 *
 * @param comparator Shared by all worker threads
 * @param config Server configuration (enrichment default)
 * @param metrics May be null when metrics are disabled
 * @param workers Pool that runs comparisons off the I/O threads; when
 *                null they run inline on the I/O thread
 */
void RegisterHandlers(std::shared_ptr<const Comparator> comparator,
                      const Config& config,
                      std::shared_ptr<ServiceMetrics> metrics,
                      std::shared_ptr<trantor::ConcurrentTaskQueue> workers);

}  // namespace simlens::server
