#include "transport/http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "device_api_error.hpp"

namespace devportal::transport {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = ssl::stream<beast::tcp_stream>;

std::string Base64Encode(std::string_view input) {
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator.
  std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
  const int len = EVP_EncodeBlock(
      out.data(), reinterpret_cast<const unsigned char *>(input.data()),
      static_cast<int>(input.size()));
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(len));
}

int NetworkErrorCode(const beast::error_code &ec, int fallback) {
  if (ec == beast::error::timeout) {
    return my_errors::NETWORK::TIMEOUT_ERROR;
  }
  return fallback;
}

template <typename Stream>
class HttpGetCall : public std::enable_shared_from_this<HttpGetCall<Stream>> {
public:
  template <typename... StreamArgs>
  HttpGetCall(net::io_context &ioc, http::request<http::empty_body> request,
              const data::Connection &connection,
              const HttpTransportOptions &options, GetHandler handler,
              StreamArgs &&...stream_args)
      : strand_(net::make_strand(ioc)), resolver_(strand_),
        resolve_timer_(strand_),
        stream_(strand_, std::forward<StreamArgs>(stream_args)...),
        request_(std::move(request)), host_(connection.host),
        port_(std::to_string(connection.port)),
        timeout_(options.request_timeout), verify_tls_(options.verify_tls),
        handler_(std::move(handler)) {
    parser_.body_limit(options.max_body_bytes);
  }

  void Start() {
    if constexpr (std::is_same_v<Stream, TlsStream>) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
        Fail(my_errors::NETWORK::SSL_ERROR,
             fmt::format("failed to set SNI host '{}': {}", host_,
                         ec.message()));
        return;
      }
      if (verify_tls_) {
        stream_.set_verify_callback(ssl::host_name_verification(host_));
      }
    }
    // tcp_stream deadlines start at connect; the lookup gets its own timer.
    resolve_timer_.expires_after(timeout_);
    resolve_timer_.async_wait(beast::bind_front_handler(
        &HttpGetCall::OnResolveTimeout, this->shared_from_this()));
    resolver_.async_resolve(
        host_, port_,
        beast::bind_front_handler(&HttpGetCall::OnResolve,
                                  this->shared_from_this()));
  }

  // The TLS stream refers to the context, which must outlive the call even
  // if the owning transport is replaced mid-request.
  void KeepAlive(std::shared_ptr<ssl::context> ctx) { ssl_ctx_ = std::move(ctx); }

private:
  void OnResolveTimeout(const beast::error_code &ec) {
    if (ec == net::error::operation_aborted || resolved_) {
      return;
    }
    resolve_timed_out_ = true;
    resolver_.cancel();
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    resolved_ = true;
    resolve_timer_.cancel();
    if (resolve_timed_out_) {
      Fail(my_errors::NETWORK::TIMEOUT_ERROR,
           fmt::format("resolve {} timed out after {}s", host_,
                       timeout_.count()));
      return;
    }
    if (ec) {
      Fail(my_errors::NETWORK::CONNECT_ERROR,
           fmt::format("resolve {} failed: {}", host_, ec.message()));
      return;
    }
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&HttpGetCall::OnConnect,
                                           this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail(NetworkErrorCode(ec, my_errors::NETWORK::CONNECT_ERROR),
           fmt::format("connect {}:{} failed: {}", host_, port_,
                       ec.message()));
      return;
    }
    if constexpr (std::is_same_v<Stream, TlsStream>) {
      beast::get_lowest_layer(stream_).expires_after(timeout_);
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&HttpGetCall::OnHandshake,
                                    this->shared_from_this()));
    } else {
      Write();
    }
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail(NetworkErrorCode(ec, my_errors::NETWORK::SSL_HANDSHAKE_ERROR),
           fmt::format("TLS handshake with {} failed: {}", host_,
                       ec.message()));
      return;
    }
    Write();
  }

  void Write() {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&HttpGetCall::OnWrite,
                                                this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(NetworkErrorCode(ec, my_errors::NETWORK::WRITE_ERROR),
           fmt::format("write {} failed: {}", std::string(request_.target()),
                       ec.message()));
      return;
    }
    http::async_read(stream_, buffer_, parser_,
                     beast::bind_front_handler(&HttpGetCall::OnRead,
                                               this->shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(NetworkErrorCode(ec, my_errors::NETWORK::READ_ERROR),
           fmt::format("read {} failed: {}", std::string(request_.target()),
                       ec.message()));
      return;
    }
    auto response = parser_.release();
    const int status = response.result_int();
    Close();

    BOOST_LOG_SEV(lg_, trivial::debug)
        << "GET " << request_.target() << " -> HTTP " << status << " ("
        << response.body().size() << " bytes)";

    if (status < 200 || status >= 300) {
      Fail(my_errors::NETWORK::HTTP_STATUS_ERROR,
           fmt::format("GET {} returned HTTP {}",
                       std::string(request_.target()), status),
           status);
      return;
    }
    auto handler = std::move(handler_);
    if (response.body().empty()) {
      handler(nullptr, std::nullopt);
    } else {
      handler(nullptr, std::move(response.body()));
    }
  }

  void Close() {
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().shutdown(
        tcp::socket::shutdown_both, ignore);
    beast::get_lowest_layer(stream_).close();
  }

  void Fail(int code, const std::string &what, int http_status = 0) {
    BOOST_LOG_SEV(lg_, trivial::error) << what;
    Close();
    auto handler = std::move(handler_);
    handler(std::make_exception_ptr(DeviceApiError(code, what, http_status)),
            std::nullopt);
  }

  std::shared_ptr<ssl::context> ssl_ctx_;
  net::strand<net::io_context::executor_type> strand_;
  tcp::resolver resolver_;
  net::steady_timer resolve_timer_;
  bool resolved_{false};
  bool resolve_timed_out_{false};
  Stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::empty_body> request_;
  http::response_parser<http::string_body> parser_;
  std::string host_;
  std::string port_;
  std::chrono::seconds timeout_;
  bool verify_tls_;
  GetHandler handler_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace

std::string build_authorization(const data::Credentials &credentials) {
  if (credentials.uses_token()) {
    return "Bearer " + credentials.token;
  }
  return "Basic " +
         Base64Encode(credentials.username + ":" + credentials.password);
}

HttpTransport::HttpTransport(net::io_context &ioc, data::Connection connection,
                             data::Credentials credentials,
                             HttpTransportOptions options)
    : ioc_(ioc), connection_(std::move(connection)),
      authorization_(build_authorization(credentials)),
      options_(std::move(options)),
      ssl_ctx_(std::make_shared<ssl::context>(ssl::context::tls_client)) {
  if (connection_.empty()) {
    throw DeviceApiError(my_errors::GENERAL::INVALID_ARGUMENT,
                         "HttpTransport requires a device host");
  }
  if (connection_.secure()) {
    ConfigureSsl();
  }
}

void HttpTransport::ConfigureSsl() {
  if (options_.verify_tls) {
    try {
      ssl_ctx_->set_default_verify_paths();
      ssl_ctx_->set_verify_mode(ssl::verify_peer);
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::error)
          << "TLS verify setup failed: " << ex.what();
      throw DeviceApiError(
          my_errors::NETWORK::SSL_ERROR,
          fmt::format("cannot enable certificate verification: {}",
                      ex.what()));
    }
  } else {
    ssl_ctx_->set_verify_mode(ssl::verify_none);
  }
}

void HttpTransport::async_get(const std::string &path, GetHandler handler) {
  http::request<http::empty_body> req{http::verb::get, path, 11};
  req.set(http::field::host, connection_.host_header());
  req.set(http::field::user_agent, options_.user_agent);
  req.set(http::field::accept, "application/json");
  req.set(http::field::authorization, authorization_);
  req.set(http::field::connection, "close");

  BOOST_LOG_SEV(lg, trivial::trace)
      << "Dispatching GET " << connection_.base_url() << path;

  if (connection_.secure()) {
    auto call = std::make_shared<HttpGetCall<TlsStream>>(
        ioc_, std::move(req), connection_, options_, std::move(handler),
        *ssl_ctx_);
    call->KeepAlive(ssl_ctx_);
    call->Start();
  } else {
    auto call = std::make_shared<HttpGetCall<PlainStream>>(
        ioc_, std::move(req), connection_, options_, std::move(handler));
    call->Start();
  }
}

TransportFactory make_http_transport_factory(net::io_context &ioc,
                                             HttpTransportOptions options) {
  return [&ioc, options](const data::Connection &connection,
                         const data::Credentials &credentials)
             -> std::shared_ptr<IDeviceTransport> {
    return std::make_shared<HttpTransport>(ioc, connection, credentials,
                                           options);
  };
}

} // namespace devportal::transport
