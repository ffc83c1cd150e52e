#include "nexus/http_transport.hpp"

#include <httplib.h>

namespace nexus::events {

HttpGraphqlTransport::HttpGraphqlTransport(std::string url, std::chrono::seconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
  const auto scheme_end = url_.find("://");
  const auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  const auto path_start = url_.find('/', host_start);
  if (path_start == std::string::npos) {
    base_ = url_;
    path_ = "/";
  } else {
    base_ = url_.substr(0, path_start);
    path_ = url_.substr(path_start);
  }
}

std::optional<std::string> HttpGraphqlTransport::post(const std::string& request_json, Error* error) {
  httplib::Client client(base_);
  client.set_connection_timeout(timeout_);
  client.set_read_timeout(timeout_);
  client.set_write_timeout(timeout_);

  auto res = client.Post(path_, request_json, "application/json");
  if (!res) {
    set_error(error, ErrorCode::transport_error, "POST " + url_ + " failed: " + httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    set_error(error, ErrorCode::transport_error, "POST " + url_ + " returned HTTP " + std::to_string(res->status));
    return std::nullopt;
  }
  return res->body;
}

}  // namespace nexus::events
