#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "data/connection.hpp"
#include "device_api_error.hpp"
#include "transport/device_transport.hpp"

namespace devportal::testing {

// Shared by every transport a RecordingTransportFactory builds, so tests can
// look at requests after the client has swapped transports.
struct TransportLog {
  struct Request {
    std::string path;
    data::Connection connection;
    data::Credentials credentials;
  };

  struct Pending {
    std::string path;
    transport::GetHandler handler;
  };

  std::vector<Request> requests;
  std::map<std::string, std::optional<std::string>> bodies;
  std::optional<DeviceApiError> failure;
  int transports_built{0};

  // When set, requests are parked in `pending` until complete_pending().
  bool defer{false};
  std::vector<Pending> pending;

  // Builds past this count return null, or throw when `build_error` is set.
  std::optional<int> build_limit;
  std::optional<DeviceApiError> build_error;

  void respond(const std::string &path,
               const transport::GetHandler &handler) const {
    if (failure) {
      handler(std::make_exception_ptr(*failure), std::nullopt);
      return;
    }
    auto it = bodies.find(path);
    if (it == bodies.end()) {
      handler(nullptr, std::nullopt);
      return;
    }
    handler(nullptr, it->second);
  }

  std::size_t complete_pending() {
    auto parked = std::move(pending);
    pending.clear();
    for (const auto &p : parked) {
      respond(p.path, p.handler);
    }
    return parked.size();
  }
};

class RecordingTransport : public transport::IDeviceTransport {
public:
  RecordingTransport(std::shared_ptr<TransportLog> log,
                     data::Connection connection,
                     data::Credentials credentials)
      : log_(std::move(log)), connection_(std::move(connection)),
        credentials_(std::move(credentials)) {}

  void async_get(const std::string &path,
                 transport::GetHandler handler) override {
    log_->requests.push_back({path, connection_, credentials_});
    if (log_->defer) {
      log_->pending.push_back({path, std::move(handler)});
      return;
    }
    log_->respond(path, handler);
  }

private:
  std::shared_ptr<TransportLog> log_;
  data::Connection connection_;
  data::Credentials credentials_;
};

inline transport::TransportFactory
RecordingTransportFactory(std::shared_ptr<TransportLog> log) {
  return [log](const data::Connection &connection,
               const data::Credentials &credentials)
             -> std::shared_ptr<transport::IDeviceTransport> {
    if (log->build_limit && log->transports_built >= *log->build_limit) {
      if (log->build_error) {
        throw *log->build_error;
      }
      return nullptr;
    }
    ++log->transports_built;
    return std::make_shared<RecordingTransport>(log, connection, credentials);
  };
}

} // namespace devportal::testing
