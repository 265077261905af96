#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "data/connection.hpp"
#include "transport/device_transport.hpp"
#include "util/my_logging.hpp"

namespace devportal::transport {

struct HttpTransportOptions {
  std::chrono::seconds request_timeout{30};
  bool verify_tls{true};
  std::string user_agent{"devportal/1.0"};
  std::size_t max_body_bytes{8 * 1024 * 1024};
};

// "Basic base64(user:password)" or "Bearer <token>"; the token wins.
std::string build_authorization(const data::Credentials &credentials);

// Issues GETs against one device with Boost.Beast. Every request opens its
// own connection ("Connection: close"), so concurrent calls do not share a
// socket.
class HttpTransport : public IDeviceTransport {
public:
  HttpTransport(boost::asio::io_context &ioc, data::Connection connection,
                data::Credentials credentials,
                HttpTransportOptions options = {});

  void async_get(const std::string &path, GetHandler handler) override;

  const data::Connection &connection() const { return connection_; }

private:
  void ConfigureSsl();

  boost::asio::io_context &ioc_;
  data::Connection connection_;
  std::string authorization_;
  HttpTransportOptions options_;
  std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
  src::severity_logger<trivial::severity_level> lg;
};

TransportFactory make_http_transport_factory(boost::asio::io_context &ioc,
                                             HttpTransportOptions options = {});

} // namespace devportal::transport
