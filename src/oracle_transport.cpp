#include <simlens/oracle_client.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/net/EventLoopThread.h>

namespace simlens {

namespace {

const char* ReqResultName(drogon::ReqResult result) {
  switch (result) {
    case drogon::ReqResult::Ok:
      return "ok";
    case drogon::ReqResult::BadResponse:
      return "bad response";
    case drogon::ReqResult::NetworkFailure:
      return "network failure";
    case drogon::ReqResult::BadServerAddress:
      return "bad server address";
    case drogon::ReqResult::Timeout:
      return "timeout";
    case drogon::ReqResult::HandshakeError:
      return "TLS handshake error";
    default:
      return "request failed";
  }
}

/**
 * Oracle transport on Drogon HTTP clients.
 *
 * Clients run on a private event loop thread, so the blocking
 * sendRequest() may be called from Drogon I/O threads (or any other
 * thread) without waiting on its own loop. A client is created per
 * request so that concurrent comparisons do not queue behind each other
 * on one connection.
 */
class DrogonTransport : public OracleTransport {
 public:
  explicit DrogonTransport(std::string base_url)
      : base_url_(std::move(base_url)), loop_thread_("simlens-oracle") {
    if (!base_url_.empty() && base_url_.back() == '/') {
      base_url_.pop_back();
    }
    loop_thread_.run();
  }

  TransportResponse Post(const std::string& path,
                         const std::string& body,
                         const Headers& headers,
                         double timeout_seconds) const override {
    TransportResponse out;

    auto client = drogon::HttpClient::newHttpClient(base_url_, loop_thread_.getLoop());

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(path);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    req->setBody(body);
    for (const auto& [name, value] : headers) {
      req->addHeader(name, value);
    }

    auto [result, resp] = client->sendRequest(req, timeout_seconds);

    if (result == drogon::ReqResult::Timeout) {
      out.result = TransportResponse::Result::kTimeout;
      out.error_message = ReqResultName(result);
      return out;
    }
    if (result != drogon::ReqResult::Ok || !resp) {
      out.result = TransportResponse::Result::kFailure;
      out.error_message = ReqResultName(result);
      return out;
    }

    out.result = TransportResponse::Result::kOk;
    out.status_code = static_cast<int>(resp->statusCode());
    out.body = std::string(resp->body());
    return out;
  }

 private:
  std::string base_url_;
  mutable trantor::EventLoopThread loop_thread_;
};

}  // namespace

std::unique_ptr<OracleTransport> CreateHttpTransport(const std::string& base_url) {
  return std::make_unique<DrogonTransport>(base_url);
}

}  // namespace simlens
