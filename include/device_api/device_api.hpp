#pragma once

#include <boost/json.hpp>
#include <exception>
#include <fmt/format.h>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "conf/devportal_config.hpp"
#include "data/appx_packages.hpp"
#include "data/connection.hpp"
#include "data/networking.hpp"
#include "data/os_info.hpp"
#include "device_api_error.hpp"
#include "transport/device_transport.hpp"
#include "util/my_logging.hpp"

namespace devportal {

inline constexpr const char *kMachineNamePath = "/api/os/machinename";
inline constexpr const char *kSoftwareInfoPath = "/api/os/info";
inline constexpr const char *kIpConfigPath = "/api/networking/ipconfig";
inline constexpr const char *kInstalledPackagesPath =
    "/api/appx/packagemanager/packages";

enum class FetchStatus { Ok, Empty, DecodeError };

template <typename T> struct FetchResult {
  FetchStatus status{FetchStatus::Empty};
  std::optional<T> value;
  std::string error;

  bool ok() const { return status == FetchStatus::Ok; }
};

// std::nullopt is the "empty" value: the device sent nothing, or sent
// something that did not decode.
template <typename T>
using FetchHandler = std::function<void(std::exception_ptr, std::optional<T>)>;

template <typename T>
using FetchResultHandler =
    std::function<void(std::exception_ptr, FetchResult<T>)>;

template <typename T>
FetchResult<T> decode_body(const std::string &path,
                           const std::optional<std::string> &body) {
  FetchResult<T> result;
  if (!body || body->empty()) {
    return result;
  }
  src::severity_logger<trivial::severity_level> lg;
  boost::system::error_code ec;
  auto jv = boost::json::parse(*body, ec);
  if (ec) {
    result.status = FetchStatus::DecodeError;
    result.error = fmt::format("{}: malformed JSON: {}", path, ec.message());
    BOOST_LOG_SEV(lg, trivial::warning) << result.error;
    return result;
  }
  if (jv.is_null()) {
    return result;
  }
  try {
    result.value = boost::json::value_to<T>(jv);
    result.status = FetchStatus::Ok;
  } catch (const std::exception &ex) {
    result.status = FetchStatus::DecodeError;
    result.error = fmt::format("{}: unexpected shape: {}", path, ex.what());
    BOOST_LOG_SEV(lg, trivial::warning) << result.error;
  }
  return result;
}

class IDeviceApi {
public:
  virtual ~IDeviceApi() = default;

  virtual void initialize(const data::Connection &connection,
                          const data::Credentials &credentials) = 0;
  virtual void set_connection(const data::Connection &connection) = 0;
  virtual void set_credentials(const data::Credentials &credentials) = 0;

  virtual std::optional<data::Connection> connection() const = 0;
  virtual std::optional<data::Credentials> credentials() const = 0;

  virtual void get_machine_name(FetchHandler<data::MachineName> handler) = 0;
  virtual void get_software_info(FetchHandler<data::SoftwareInfo> handler) = 0;
  virtual void get_ip_config(FetchHandler<data::IpConfig> handler) = 0;
  virtual void
  get_installed_packages(FetchHandler<data::AppXPackages> handler) = 0;
};

/**
 * Client for a device's management REST API.
 *
 * Connection and credentials can be supplied at construction or later via
 * initialize(). Every change to either rebuilds the transport through the
 * factory. Fetches started before a change keep the transport they began
 * with; setters are not synchronized against in-flight fetches. A setter
 * whose transport cannot be built leaves the previous pair and transport in
 * place.
 *
 * The handlers run on whatever thread runs the transport's io_context. The
 * std::future overloads only complete while some thread is running that
 * io_context, so calling get() on the same thread that should run it blocks
 * forever.
 *
 * Fetches fail with GENERAL::PRECONDITION_FAILED until the client is
 * configured. Network and HTTP errors reach the handler as exceptions;
 * undecodable bodies do not (see fetch_result() to tell them apart).
 */
class DeviceApiClient : public IDeviceApi {
public:
  explicit DeviceApiClient(transport::TransportFactory factory);
  DeviceApiClient(transport::TransportFactory factory,
                  const data::Connection &connection,
                  const data::Credentials &credentials);

  static std::unique_ptr<DeviceApiClient>
  create(transport::TransportFactory factory, const DevPortalConfig &config);

  void initialize(const data::Connection &connection,
                  const data::Credentials &credentials) override;
  void set_connection(const data::Connection &connection) override;
  void set_credentials(const data::Credentials &credentials) override;

  std::optional<data::Connection> connection() const override {
    return connection_;
  }
  std::optional<data::Credentials> credentials() const override {
    return credentials_;
  }
  bool is_configured() const { return transport_ != nullptr; }

  void get_machine_name(FetchHandler<data::MachineName> handler) override;
  void get_software_info(FetchHandler<data::SoftwareInfo> handler) override;
  void get_ip_config(FetchHandler<data::IpConfig> handler) override;
  void
  get_installed_packages(FetchHandler<data::AppXPackages> handler) override;

  std::future<std::optional<data::MachineName>> get_machine_name();
  std::future<std::optional<data::SoftwareInfo>> get_software_info();
  std::future<std::optional<data::IpConfig>> get_ip_config();
  std::future<std::optional<data::AppXPackages>> get_installed_packages();

  template <typename T>
  void fetch_result(const std::string &path, FetchResultHandler<T> handler) {
    auto transport = require_transport();
    transport->async_get(
        path, [path, handler = std::move(handler)](
                  std::exception_ptr ep, std::optional<std::string> body) {
          if (ep) {
            handler(ep, FetchResult<T>{});
            return;
          }
          handler(nullptr, decode_body<T>(path, body));
        });
  }

  template <typename T>
  void fetch(const std::string &path, FetchHandler<T> handler) {
    fetch_result<T>(path, [handler = std::move(handler)](
                              std::exception_ptr ep, FetchResult<T> result) {
      handler(ep, std::move(result.value));
    });
  }

  template <typename T>
  std::future<std::optional<T>> fetch(const std::string &path) {
    auto promise = std::make_shared<std::promise<std::optional<T>>>();
    auto future = promise->get_future();
    fetch<T>(path, [promise](std::exception_ptr ep, std::optional<T> value) {
      if (ep) {
        promise->set_exception(ep);
      } else {
        promise->set_value(std::move(value));
      }
    });
    return future;
  }

private:
  static void validate(const data::Connection &connection);
  static void validate(const data::Credentials &credentials);
  void rebuild_transport(const data::Connection &connection,
                         const data::Credentials &credentials);
  std::shared_ptr<transport::IDeviceTransport> require_transport() const;

  transport::TransportFactory factory_;
  std::optional<data::Connection> connection_;
  std::optional<data::Credentials> credentials_;
  std::shared_ptr<transport::IDeviceTransport> transport_;
  mutable src::severity_logger<trivial::severity_level> lg;
};

} // namespace devportal
