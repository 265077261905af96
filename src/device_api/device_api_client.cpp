#include "device_api/device_api.hpp"

#include <fmt/format.h>
#include <utility>

namespace devportal {

DeviceApiClient::DeviceApiClient(transport::TransportFactory factory)
    : factory_(std::move(factory)) {
  if (!factory_) {
    throw DeviceApiError(my_errors::GENERAL::INVALID_ARGUMENT,
                         "DeviceApiClient requires a transport factory");
  }
}

DeviceApiClient::DeviceApiClient(transport::TransportFactory factory,
                                 const data::Connection &connection,
                                 const data::Credentials &credentials)
    : DeviceApiClient(std::move(factory)) {
  initialize(connection, credentials);
}

std::unique_ptr<DeviceApiClient>
DeviceApiClient::create(transport::TransportFactory factory,
                        const DevPortalConfig &config) {
  return std::make_unique<DeviceApiClient>(
      std::move(factory), config.to_connection(), config.to_credentials());
}

void DeviceApiClient::validate(const data::Connection &connection) {
  if (connection.empty()) {
    throw DeviceApiError(my_errors::GENERAL::INVALID_ARGUMENT,
                         "connection: device host must not be empty");
  }
  if (connection.scheme != "http" && connection.scheme != "https") {
    throw DeviceApiError(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("connection: unsupported scheme '{}'", connection.scheme));
  }
  if (connection.port == 0) {
    throw DeviceApiError(my_errors::GENERAL::INVALID_ARGUMENT,
                         "connection: port must not be 0");
  }
}

void DeviceApiClient::validate(const data::Credentials &credentials) {
  if (credentials.empty()) {
    throw DeviceApiError(my_errors::GENERAL::INVALID_ARGUMENT,
                         "credentials: username or token required");
  }
}

void DeviceApiClient::initialize(const data::Connection &connection,
                                 const data::Credentials &credentials) {
  validate(connection);
  validate(credentials);
  rebuild_transport(connection, credentials);
}

void DeviceApiClient::set_connection(const data::Connection &connection) {
  validate(connection);
  if (!credentials_) {
    connection_ = connection;
    throw DeviceApiError(my_errors::GENERAL::PRECONDITION_FAILED,
                         "Set credentials before initializing client.");
  }
  rebuild_transport(connection, *credentials_);
}

void DeviceApiClient::set_credentials(const data::Credentials &credentials) {
  validate(credentials);
  if (!connection_) {
    credentials_ = credentials;
    throw DeviceApiError(
        my_errors::GENERAL::PRECONDITION_FAILED,
        "Set connection information before initializing client.");
  }
  rebuild_transport(*connection_, credentials);
}

// Nothing is assigned unless the factory produced a transport, so the stored
// pair always matches the live transport.
void DeviceApiClient::rebuild_transport(const data::Connection &connection,
                                        const data::Credentials &credentials) {
  auto transport = factory_(connection, credentials);
  if (!transport) {
    throw DeviceApiError(my_errors::GENERAL::POINTER_IS_NULL,
                         "transport factory returned no transport");
  }
  connection_ = connection;
  credentials_ = credentials;
  transport_ = std::move(transport);
  BOOST_LOG_SEV(lg, trivial::debug)
      << "Transport rebuilt for " << connection_->base_url() << " ("
      << (credentials_->uses_token() ? "bearer" : "basic") << " auth)";
}

std::shared_ptr<transport::IDeviceTransport>
DeviceApiClient::require_transport() const {
  if (!transport_) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Fetch attempted before the client was initialized";
    throw DeviceApiError(my_errors::GENERAL::PRECONDITION_FAILED,
                         "Device API client is not initialized; set "
                         "connection and credentials first.");
  }
  return transport_;
}

void DeviceApiClient::get_machine_name(
    FetchHandler<data::MachineName> handler) {
  fetch<data::MachineName>(kMachineNamePath, std::move(handler));
}

void DeviceApiClient::get_software_info(
    FetchHandler<data::SoftwareInfo> handler) {
  fetch<data::SoftwareInfo>(kSoftwareInfoPath, std::move(handler));
}

void DeviceApiClient::get_ip_config(FetchHandler<data::IpConfig> handler) {
  fetch<data::IpConfig>(kIpConfigPath, std::move(handler));
}

void DeviceApiClient::get_installed_packages(
    FetchHandler<data::AppXPackages> handler) {
  fetch<data::AppXPackages>(kInstalledPackagesPath, std::move(handler));
}

std::future<std::optional<data::MachineName>>
DeviceApiClient::get_machine_name() {
  return fetch<data::MachineName>(kMachineNamePath);
}

std::future<std::optional<data::SoftwareInfo>>
DeviceApiClient::get_software_info() {
  return fetch<data::SoftwareInfo>(kSoftwareInfoPath);
}

std::future<std::optional<data::IpConfig>> DeviceApiClient::get_ip_config() {
  return fetch<data::IpConfig>(kIpConfigPath);
}

std::future<std::optional<data::AppXPackages>>
DeviceApiClient::get_installed_packages() {
  return fetch<data::AppXPackages>(kInstalledPackagesPath);
}

} // namespace devportal
