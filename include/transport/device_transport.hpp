#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "data/connection.hpp"

namespace devportal::transport {

// Completion for a GET: either an exception, or the body (std::nullopt when
// the device answered without one).
using GetHandler =
    std::function<void(std::exception_ptr, std::optional<std::string>)>;

class IDeviceTransport {
public:
  virtual ~IDeviceTransport() = default;

  virtual void async_get(const std::string &path, GetHandler handler) = 0;
};

using TransportFactory = std::function<std::shared_ptr<IDeviceTransport>(
    const data::Connection &, const data::Credentials &)>;

} // namespace devportal::transport
