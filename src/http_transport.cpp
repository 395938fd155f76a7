#include "bluos/http_transport.h"

#include "bluos/errors.h"
#include "bluos/validators.h"
#include "log.h"
#include "resolve_worker.h"
#include "string_util.h"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <algorithm>
#include <functional>
#include <sstream>

namespace bluos
{

using asio::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace
{

typedef std::function<void(const asio::error_code &, std::size_t)> StepHandler;

struct StepResult
{
  asio::error_code ec;
  std::size_t bytes = 0;
};

// Runs one asynchronous operation until it completes or the deadline
// passes. On timeout the operation is cancelled and drained before
// throwing.
StepResult run_step(asio::io_context &io, Clock::time_point deadline,
                    const std::function<void(StepHandler)> &start,
                    const std::function<void()> &cancel,
                    const std::string &what, const std::string &host)
{
  bool done = false;
  StepResult result;
  io.restart();
  start([&](const asio::error_code &ec, std::size_t n) {
    done = true;
    result.ec = ec;
    result.bytes = n;
  });
  io.run_until(deadline);
  if (!done)
  {
    cancel();
    io.restart();
    io.run();
    throw TransportError(ErrorKind::Timeout, what + " " + host + " timed out", host);
  }
  return result;
}

void raise_network_error(const asio::error_code &ec, const std::string &what, const std::string &host)
{
  ErrorKind kind = ErrorKind::ConnectionFailed;
  if (ec == asio::error::connection_reset || ec == asio::error::connection_aborted ||
      ec == asio::error::broken_pipe || ec == asio::error::eof)
  {
    kind = ErrorKind::ConnectionReset;
  }
  else if (ec == asio::error::timed_out)
  {
    kind = ErrorKind::Timeout;
  }
  throw TransportError(kind, what + " " + host + ": " + ec.message(), host);
}

bool has_crlf(const std::string &s)
{
  return s.find_first_of("\r\n") != std::string::npos;
}

// True once a reply carries its whole body, so keep-alive peers need not
// close the connection for the read to finish.
bool response_complete(const std::string &raw)
{
  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos)
    return false;

  std::string head = to_lower(raw.substr(0, header_end));
  size_t body_start = header_end + 4;

  if (head.find("\r\ntransfer-encoding: chunked") != std::string::npos)
  {
    return raw.size() >= body_start + 5 && raw.compare(raw.size() - 5, 5, "0\r\n\r\n") == 0;
  }

  size_t pos = head.find("\r\ncontent-length:");
  if (pos == std::string::npos)
    return false;
  size_t value_start = pos + 17;
  size_t value_end = head.find("\r\n", value_start);
  long length = 0;
  if (!parse_long(head.substr(value_start, value_end - value_start), length) || length < 0)
    return false;
  return raw.size() >= body_start + static_cast<size_t>(length);
}

template <typename Stream>
std::string exchange(asio::io_context &io, Stream &stream, tcp::socket &socket, const std::string &payload,
                     Clock::time_point deadline, size_t max_raw, const std::string &host)
{
  auto cancel = [&socket]() {
    asio::error_code ignored;
    socket.close(ignored);
  };

  StepResult written = run_step(
      io, deadline,
      [&](StepHandler h) { asio::async_write(stream, asio::buffer(payload), h); },
      cancel, "sending request to", host);
  if (written.ec)
    raise_network_error(written.ec, "sending request to", host);

  std::string raw;
  char buffer[8192];
  while (!response_complete(raw))
  {
    StepResult read = run_step(
        io, deadline,
        [&](StepHandler h) { stream.async_read_some(asio::buffer(buffer), h); },
        cancel, "reading reply from", host);

    raw.append(buffer, read.bytes);
    if (raw.size() > max_raw)
    {
      cancel();
      throw ProtocolError("reply exceeds " + std::to_string(max_raw) + " bytes", host);
    }

    if (read.ec == asio::error::eof || read.ec == asio::ssl::error::stream_truncated)
      break;
    if (read.ec)
      raise_network_error(read.ec, "reading reply from", host);
  }

  if (raw.empty())
    throw TransportError(ErrorKind::ConnectionReset, "connection closed without reply by " + host, host);
  return raw;
}

std::string decode_chunked(const std::string &body, size_t max_body)
{
  std::string out;
  size_t pos = 0;
  while (true)
  {
    size_t line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos)
      throw ProtocolError("truncated chunk header");

    std::string size_text = body.substr(pos, line_end - pos);
    size_t ext = size_text.find(';');
    if (ext != std::string::npos)
      size_text.erase(ext);
    size_text = trim(size_text);

    char *end = nullptr;
    unsigned long chunk = std::strtoul(size_text.c_str(), &end, 16);
    if (size_text.empty() || *end != '\0')
      throw ProtocolError("bad chunk size '" + size_text + "'");

    pos = line_end + 2;
    if (chunk == 0)
      break;
    if (chunk > max_body || out.size() + chunk > max_body)
      throw ProtocolError("reply body exceeds " + std::to_string(max_body) + " bytes");
    if (pos + chunk + 2 > body.size())
      throw ProtocolError("truncated chunk");

    out.append(body, pos, chunk);
    pos += chunk;
    if (body.compare(pos, 2, "\r\n") != 0)
      throw ProtocolError("chunk not terminated by CRLF");
    pos += 2;
  }
  return out;
}

} // namespace

std::string percent_encode(const std::string &text)
{
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text)
  {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
    {
      out += static_cast<char>(c);
    }
    else
    {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>> &params)
{
  std::string out;
  for (const auto &p : params)
  {
    if (!out.empty())
      out += '&';
    out += percent_encode(p.first);
    out += '=';
    out += percent_encode(p.second);
  }
  return out;
}

std::string serialize_http_request(const HttpRequest &request)
{
  if (has_crlf(request.host) || has_crlf(request.target) || request.target.empty() || request.target[0] != '/')
    throw ValidationError("malformed request target", request.host);

  std::ostringstream out;
  out << (request.method == HttpMethod::Post ? "POST " : "GET ") << request.target << " HTTP/1.1\r\n";
  out << "Host: " << request.host;
  if (request.port != (request.https ? 443 : 80))
    out << ":" << request.port;
  out << "\r\n";
  out << "User-Agent: bluos-control\r\n";
  out << "Accept: */*\r\n";
  out << "Connection: close\r\n";

  bool has_content_type = false;
  for (const auto &h : request.headers)
  {
    if (has_crlf(h.first) || has_crlf(h.second))
      throw ValidationError("header " + h.first + " contains a line break", request.host);
    if (to_lower(h.first) == "content-type")
      has_content_type = true;
    out << h.first << ": " << h.second << "\r\n";
  }

  if (request.method == HttpMethod::Post || !request.body.empty())
  {
    if (!has_content_type && !request.body.empty())
      out << "Content-Type: application/x-www-form-urlencoded\r\n";
    out << "Content-Length: " << request.body.size() << "\r\n";
  }
  out << "\r\n";
  out << request.body;
  return out.str();
}

HttpResponse parse_http_response(const std::string &raw, size_t max_body)
{
  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos)
    throw ProtocolError("incomplete HTTP header");
  if (header_end > MAX_HEADER_SIZE)
    throw ProtocolError("HTTP header exceeds " + std::to_string(MAX_HEADER_SIZE) + " bytes");

  HttpResponse response;
  std::istringstream head(raw.substr(0, header_end));
  std::string line;
  std::getline(head, line);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();

  std::istringstream status_line(line);
  std::string version;
  status_line >> version >> response.status;
  if (!starts_with(version, "HTTP/1.") || response.status < 100 || response.status > 599)
    throw ProtocolError("malformed status line '" + line + "'");

  while (std::getline(head, line))
  {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    size_t colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    response.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }

  std::string body = raw.substr(header_end + 4);
  auto te = response.headers.find("transfer-encoding");
  auto cl = response.headers.find("content-length");
  if (te != response.headers.end() && to_lower(te->second).find("chunked") != std::string::npos)
  {
    body = decode_chunked(body, max_body);
  }
  else if (cl != response.headers.end())
  {
    long length = 0;
    if (!parse_long(cl->second, length) || length < 0)
      throw ProtocolError("bad Content-Length '" + cl->second + "'");
    if (static_cast<size_t>(length) > max_body)
      throw ProtocolError("reply body exceeds " + std::to_string(max_body) + " bytes");
    if (body.size() < static_cast<size_t>(length))
      throw ProtocolError("reply body shorter than Content-Length");
    body.resize(static_cast<size_t>(length));
  }

  if (body.size() > max_body)
    throw ProtocolError("reply body exceeds " + std::to_string(max_body) + " bytes");

  response.body = std::move(body);
  return response;
}

void raise_for_status(const HttpResponse &response, const std::string &address)
{
  if (response.status >= 500)
  {
    throw TransportError(ErrorKind::ServerError, "device returned HTTP " + std::to_string(response.status),
                         address, response.status);
  }
  if (response.status < 200 || response.status >= 300)
  {
    throw DeviceError("device returned HTTP " + std::to_string(response.status), address, response.status);
  }
}

AsioHttpTransport::AsioHttpTransport(TlsPolicy policy, size_t max_body) : policy_(policy), max_body_(max_body) {}

HttpResponse AsioHttpTransport::send(const HttpRequest &request)
{
  if (request.https && policy_ == TlsPolicy::TrustLocalPeer && !is_local_address(request.host))
  {
    throw ValidationError("refusing unverified TLS to non-local host " + request.host, request.host);
  }

  std::string payload = serialize_http_request(request);
  auto deadline = Clock::now() + request.timeout;
  size_t max_raw = max_body_ + MAX_HEADER_SIZE + 16 * 1024;

  asio::io_context io;
  std::vector<tcp::endpoint> endpoints;

  asio::error_code literal_ec;
  asio::ip::address_v4 literal = asio::ip::make_address_v4(request.host, literal_ec);
  if (!literal_ec)
  {
    endpoints.emplace_back(literal, request.port);
  }
  else
  {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    ResolveOutcome resolved = resolve_ipv4(request.host, std::max(remaining, std::chrono::milliseconds(0)));
    if (resolved.timed_out)
    {
      throw TransportError(ErrorKind::Timeout, "resolving " + request.host + " timed out", request.host);
    }
    if (resolved.addresses.empty())
    {
      throw TransportError(ErrorKind::ResolverFailed, "cannot resolve " + request.host + ": " + resolved.error,
                           request.host);
    }
    for (const auto &address : resolved.addresses)
    {
      asio::error_code ec;
      asio::ip::address_v4 parsed = asio::ip::make_address_v4(address, ec);
      if (!ec)
        endpoints.emplace_back(parsed, request.port);
    }
  }

  LOG((request.method == HttpMethod::Post ? "POST " : "GET ") << (request.https ? "https://" : "http://")
                                                              << request.host << ":" << request.port << request.target);

  std::string raw;
  if (!request.https)
  {
    tcp::socket socket(io);
    auto cancel = [&socket]() {
      asio::error_code ignored;
      socket.close(ignored);
    };
    StepResult connected = run_step(
        io, deadline,
        [&](StepHandler h) {
          asio::async_connect(socket, endpoints,
                              [h](const asio::error_code &ec, const tcp::endpoint &) { h(ec, 0); });
        },
        cancel, "connecting to", request.host);
    if (connected.ec)
      raise_network_error(connected.ec, "connecting to", request.host);

    raw = exchange(io, socket, socket, payload, deadline, max_raw, request.host);
  }
  else
  {
    asio::ssl::context ctx(asio::ssl::context::tls_client);
    try
    {
      if (policy_ == TlsPolicy::VerifyPeer)
      {
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(asio::ssl::verify_peer);
      }
      else
      {
        ctx.set_verify_mode(asio::ssl::verify_none);
      }
    }
    catch (const asio::system_error &e)
    {
      throw TransportError(ErrorKind::ConnectionFailed, std::string("TLS setup failed: ") + e.what(), request.host);
    }

    asio::ssl::stream<tcp::socket> stream(io, ctx);
    if (policy_ == TlsPolicy::VerifyPeer)
    {
      stream.set_verify_callback(asio::ssl::host_name_verification(request.host));
    }
    if (!SSL_set_tlsext_host_name(stream.native_handle(), request.host.c_str()))
    {
      throw TransportError(ErrorKind::ConnectionFailed, "cannot set TLS server name", request.host);
    }

    tcp::socket &socket = stream.next_layer();
    auto cancel = [&socket]() {
      asio::error_code ignored;
      socket.close(ignored);
    };
    StepResult connected = run_step(
        io, deadline,
        [&](StepHandler h) {
          asio::async_connect(socket, endpoints,
                              [h](const asio::error_code &ec, const tcp::endpoint &) { h(ec, 0); });
        },
        cancel, "connecting to", request.host);
    if (connected.ec)
      raise_network_error(connected.ec, "connecting to", request.host);

    StepResult handshake = run_step(
        io, deadline,
        [&](StepHandler h) {
          stream.async_handshake(asio::ssl::stream_base::client,
                                 [h](const asio::error_code &ec) { h(ec, 0); });
        },
        cancel, "TLS handshake with", request.host);
    if (handshake.ec)
    {
      throw TransportError(ErrorKind::ConnectionFailed,
                           "TLS handshake with " + request.host + " failed: " + handshake.ec.message(),
                           request.host);
    }

    raw = exchange(io, stream, socket, payload, deadline, max_raw, request.host);
  }

  HttpResponse response;
  try
  {
    response = parse_http_response(raw, max_body_);
  }
  catch (const ProtocolError &e)
  {
    throw ProtocolError(e.what(), request.host);
  }
  LOG("HTTP " << response.status << " from " << request.host << " (" << response.body.size() << " bytes)");
  return response;
}

} // namespace bluos
