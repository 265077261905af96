#pragma once

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <cstdint>
#include <fmt/format.h>
#include <string>

#include "device_api_error.hpp"

namespace devportal::data {

// Where the device listens. An empty host is the "absent" connection.
struct Connection {
  std::string scheme{"http"};
  std::string host;
  std::uint16_t port{8080};

  bool empty() const { return host.empty(); }
  bool secure() const { return scheme == "https"; }

  std::string host_header() const {
    std::string h = host.find(':') != std::string::npos
                        ? fmt::format("[{}]", host)
                        : host;
    if ((secure() && port == 443) || (!secure() && port == 80)) {
      return h;
    }
    return fmt::format("{}:{}", h, port);
  }

  std::string base_url() const {
    return fmt::format("{}://{}", scheme, host_header());
  }

  static Connection from_url(const std::string &url_text) {
    auto parsed = boost::urls::parse_uri(url_text);
    if (!parsed) {
      throw DeviceApiError(
          my_errors::GENERAL::INVALID_ARGUMENT,
          fmt::format("invalid device url '{}': {}", url_text,
                      parsed.error().message()));
    }
    const auto &url = parsed.value();
    if (!url.has_authority() || url.host().empty()) {
      throw DeviceApiError(
          my_errors::GENERAL::INVALID_ARGUMENT,
          fmt::format("device url missing host: '{}'", url_text));
    }
    Connection c;
    c.scheme = std::string(url.scheme());
    if (c.scheme != "http" && c.scheme != "https") {
      throw DeviceApiError(
          my_errors::GENERAL::INVALID_ARGUMENT,
          fmt::format("device url must use http:// or https:// (got '{}')",
                      c.scheme));
    }
    if (url.host_type() == boost::urls::host_type::ipv6) {
      c.host = std::string(url.host_address());
    } else {
      c.host = std::string(url.host());
    }
    if (url.has_port()) {
      c.port = url.port_number();
      if (c.port == 0) {
        throw DeviceApiError(
            my_errors::GENERAL::INVALID_ARGUMENT,
            fmt::format("device url has invalid port: '{}'", url_text));
      }
    } else {
      c.port = c.secure() ? 443 : 80;
    }
    return c;
  }

  friend bool operator==(const Connection &a, const Connection &b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
  }
  friend bool operator!=(const Connection &a, const Connection &b) {
    return !(a == b);
  }
};

// Basic credentials or a bearer token. Neither set is the "absent" value.
struct Credentials {
  std::string username;
  std::string password;
  std::string token;

  bool empty() const { return username.empty() && token.empty(); }
  bool uses_token() const { return !token.empty(); }

  static Credentials basic(std::string user, std::string pass) {
    Credentials c;
    c.username = std::move(user);
    c.password = std::move(pass);
    return c;
  }

  static Credentials bearer(std::string token) {
    Credentials c;
    c.token = std::move(token);
    return c;
  }

  friend bool operator==(const Credentials &a, const Credentials &b) {
    return a.username == b.username && a.password == b.password &&
           a.token == b.token;
  }
  friend bool operator!=(const Credentials &a, const Credentials &b) {
    return !(a == b);
  }
};

} // namespace devportal::data
