#pragma once

// nexus/http_transport.hpp: GraphQL over HTTP(S) with cpp-httplib.
//
// Built into the nexus_http target only; the core library depends on the
// GraphqlTransport interface alone.

#include <chrono>
#include <optional>
#include <string>

#include "nexus/events.hpp"

namespace nexus::events {

class HttpGraphqlTransport : public GraphqlTransport {
 public:
  // `url` is "http[s]://host[:port][/path]"; the path defaults to "/".
  explicit HttpGraphqlTransport(std::string url, std::chrono::seconds timeout = std::chrono::seconds(10));

  std::optional<std::string> post(const std::string& request_json, Error* error) override;

  const std::string& url() const { return url_; }

 private:
  std::string url_;
  std::string base_;  // scheme://host[:port]
  std::string path_;
  std::chrono::seconds timeout_;
};

}  // namespace nexus::events
