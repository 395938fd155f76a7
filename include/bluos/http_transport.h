#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace bluos
{

static const size_t MAX_RESPONSE_SIZE = 1024 * 1024;
static const size_t MAX_HEADER_SIZE = 64 * 1024;

enum class HttpMethod
{
  Get,
  Post
};

enum class TlsPolicy
{
  VerifyPeer,     // system CA store and host name check
  TrustLocalPeer  // HTTPS to local IPv4 literals only, certificate not checked
};

struct HttpRequest
{
  HttpMethod method = HttpMethod::Get;
  bool https = false;
  std::string host;
  uint16_t port = 80;
  std::string target = "/"; // path and query, already encoded
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{5000};
};

struct HttpResponse
{
  int status = 0;
  std::map<std::string, std::string> headers; // lower-case names
  std::string body;
};

// One request, one connection. Network failures are thrown as
// TransportError (Timeout, ConnectionFailed, ConnectionReset,
// ResolverFailed); malformed or oversized replies as ProtocolError. Any HTTP
// status is returned as-is.
class HttpTransport
{
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse send(const HttpRequest &request) = 0;
};

class AsioHttpTransport : public HttpTransport
{
public:
  explicit AsioHttpTransport(TlsPolicy policy, size_t max_body = MAX_RESPONSE_SIZE);

  HttpResponse send(const HttpRequest &request) override;

  TlsPolicy policy() const { return policy_; }

private:
  TlsPolicy policy_;
  size_t max_body_;
};

// Throws DeviceError for 4xx and TransportError(ServerError) for 5xx.
void raise_for_status(const HttpResponse &response, const std::string &address);

std::string percent_encode(const std::string &text);
std::string build_query(const std::vector<std::pair<std::string, std::string>> &params);

// Parses a complete HTTP/1.x reply read until end of stream. Handles
// Content-Length and chunked bodies.
HttpResponse parse_http_response(const std::string &raw, size_t max_body = MAX_RESPONSE_SIZE);

std::string serialize_http_request(const HttpRequest &request);

} // namespace bluos
